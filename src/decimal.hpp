#pragma once

#include <compare>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

#include "unexpected_codes.hpp"

// Signed amount with two fractional digits, held as integer cents.
class Decimal {
public:
  constexpr Decimal() = default;

  static constexpr Decimal
  fromCents(std::int64_t cents) {
    Decimal d;
    d.cents_ = cents;
    return d;
  }

  static constexpr Decimal
  fromUnits(std::int64_t units) {
    return fromCents(units * 100);
  }

  // Rounds to the nearest cent. Only used at the JSON boundary.
  static Decimal
  fromDouble(double value);

  // Accepts "-12", "12.3", "+12.34"; more than two fractional digits is an error.
  static std::expected<Decimal, Error>
  parse(std::string_view text);

  constexpr std::int64_t cents() const { return cents_; }

  double toDouble() const { return static_cast<double>(cents_) / 100.0; }

  std::string toString() const;

  constexpr Decimal operator-() const { return fromCents(-cents_); }
  constexpr Decimal operator+(Decimal other) const { return fromCents(cents_ + other.cents_); }
  constexpr Decimal operator-(Decimal other) const { return fromCents(cents_ - other.cents_); }

  Decimal &operator+=(Decimal other) {
    cents_ += other.cents_;
    return *this;
  }

  constexpr Decimal abs() const { return fromCents(cents_ < 0 ? -cents_ : cents_); }

  // Division rounding half away from zero; divisor must be positive.
  Decimal dividedBy(std::int64_t divisor) const;

  constexpr auto operator<=>(const Decimal &) const = default;

private:
  std::int64_t
    cents_ = 0;
};
