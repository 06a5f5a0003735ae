#include "ids.hpp"

#include <array>
#include <chrono>
#include <cstdint>
#include <random>

namespace ids {

namespace {

constexpr std::string_view alphabet = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";

std::mt19937_64 &
generator() {
  thread_local std::mt19937_64 engine{std::random_device{}()};
  return engine;
}

}

std::string
generateId(std::string_view prefix) {
  const auto millis = static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::system_clock::now().time_since_epoch()).count());

  // 128 bits: timestamp in the top 48, randomness in the low 80.
  const std::uint64_t random = generator()();
  const std::uint64_t randomHigh = generator()() & 0xFFFF;

  const std::uint64_t high = (millis << 16) | randomHigh;
  const std::uint64_t low = random;

  std::array<char, 26> encoded{};

  // 26 base32 digits cover 130 bits; the two leading bits are always zero.
  for(int i = 25; i >= 0; --i) {
    const int bit = (25 - i) * 5;
    std::uint64_t chunk = 0;

    if(bit < 64) {
      chunk = low >> bit;
      if(bit > 59) {
        chunk |= high << (64 - bit);
      }
    } else {
      chunk = high >> (bit - 64);
    }

    encoded[i] = alphabet[chunk & 0x1F];
  }

  std::string id;
  id.reserve(prefix.size() + 1 + encoded.size());
  id.append(prefix);
  id.push_back('_');
  id.append(encoded.data(), encoded.size());
  return id;
}

}
