#pragma once

#include <compare>
#include <cstdint>
#include <string>
#include <string_view>

namespace docflow::util {

/*
  Exact decimal with two fractional digits, stored as hundredths.

  Mirrors the DECIMAL(10,2) columns used for quantities and money, so
  comparisons never carry floating point tolerance. The smallest
  representable step is 0.01.
*/
class Decimal {
 public:
  static constexpr std::int64_t kScale = 100;

  constexpr Decimal() = default;

  static constexpr Decimal FromUnits(std::int64_t hundredths) {
    return Decimal(hundredths);
  }

  static constexpr Decimal FromInteger(std::int64_t whole) {
    return Decimal(whole * kScale);
  }

  // Accepts "12", "12.5", "-3.25". More than two fractional digits is rejected.
  static Decimal Parse(std::string_view text);

  constexpr std::int64_t Units() const {
    return units_;
  }

  constexpr bool IsZero() const {
    return units_ == 0;
  }
  constexpr bool IsPositive() const {
    return units_ > 0;
  }
  constexpr bool IsNegative() const {
    return units_ < 0;
  }

  // Always renders two fractional digits, e.g. "30.00".
  std::string ToString() const;

  // this * other, rounded HALF_UP to 0.01.
  Decimal Multiply(Decimal other) const;

  // this * rate / 100, rounded HALF_UP to 0.01.
  Decimal Percent(Decimal rate) const;

  Decimal operator+(Decimal other) const;
  Decimal operator-(Decimal other) const;
  Decimal& operator+=(Decimal other);
  Decimal& operator-=(Decimal other);

  constexpr auto operator<=>(const Decimal&) const = default;

 private:
  explicit constexpr Decimal(std::int64_t units) : units_(units) {
  }

  std::int64_t units_ = 0;
};

} // namespace docflow::util
