#include "decimal.hpp"

#include <cmath>
#include <format>
#include <limits>

Decimal
Decimal::fromDouble(double value) {
  return fromCents(std::llround(value * 100.0));
}

std::expected<Decimal, Error>
Decimal::parse(std::string_view text) {
  if(text.empty()) {
    return std::unexpected(makeError(UNEXPECTED_CODE::VALIDATION, "empty amount"));
  }

  bool negative = false;
  std::size_t pos = 0;

  if(text[0] == '-' || text[0] == '+') {
    negative = text[0] == '-';
    pos = 1;
  }

  std::int64_t units = 0;
  std::int64_t fraction = 0;
  int fractionDigits = 0;
  bool sawDigit = false;
  bool sawPoint = false;

  constexpr auto limit = std::numeric_limits<std::int64_t>::max() / 1000;

  for(; pos < text.size(); ++pos) {
    const char c = text[pos];

    if(c == '.') {
      if(sawPoint) {
        return std::unexpected(makeError(UNEXPECTED_CODE::VALIDATION,
                                         std::format("malformed amount '{}'", text)));
      }
      sawPoint = true;
      continue;
    }

    if(c < '0' || c > '9') {
      return std::unexpected(makeError(UNEXPECTED_CODE::VALIDATION,
                                       std::format("malformed amount '{}'", text)));
    }

    sawDigit = true;

    if(sawPoint) {
      if(++fractionDigits > 2) {
        return std::unexpected(makeError(UNEXPECTED_CODE::VALIDATION,
                                         std::format("amount '{}' has more than two decimal places", text)));
      }
      fraction = fraction * 10 + (c - '0');
    } else {
      if(units > limit) {
        return std::unexpected(makeError(UNEXPECTED_CODE::VALIDATION,
                                         std::format("amount '{}' out of range", text)));
      }
      units = units * 10 + (c - '0');
    }
  }

  if(!sawDigit) {
    return std::unexpected(makeError(UNEXPECTED_CODE::VALIDATION,
                                     std::format("malformed amount '{}'", text)));
  }

  if(fractionDigits == 1) {
    fraction *= 10;
  }

  const auto cents = units * 100 + fraction;
  return fromCents(negative ? -cents : cents);
}

std::string
Decimal::toString() const {
  const auto magnitude = cents_ < 0 ? -cents_ : cents_;
  return std::format("{}{}.{:02}", cents_ < 0 ? "-" : "", magnitude / 100, magnitude % 100);
}

Decimal
Decimal::dividedBy(std::int64_t divisor) const {
  const auto quotient = cents_ / divisor;
  const auto remainder = cents_ % divisor;
  const auto doubled = (remainder < 0 ? -remainder : remainder) * 2;

  if(doubled >= divisor) {
    return fromCents(cents_ < 0 ? quotient - 1 : quotient + 1);
  }
  return fromCents(quotient);
}
