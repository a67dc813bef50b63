#include "internal/util/decimal.hpp"

#include <limits>

#include "internal/util/errors.hpp"

namespace docflow::util {

namespace {

constexpr std::int64_t kMax = std::numeric_limits<std::int64_t>::max();

std::int64_t CheckedAdd(std::int64_t a, std::int64_t b) {
  if ((b > 0 && a > kMax - b) || (b < 0 && a < -kMax - b)) {
    throw InvalidArgument("decimal overflow");
  }
  return a + b;
}

std::int64_t CheckedMul(std::int64_t a, std::int64_t b) {
  if (a != 0 && b != 0) {
    const auto abs_a = a < 0 ? -a : a;
    const auto abs_b = b < 0 ? -b : b;
    if (abs_a > kMax / abs_b) {
      throw InvalidArgument("decimal overflow");
    }
  }
  return a * b;
}

// Scales a product of two hundredths values back down by `divisor`,
// rounding half away from zero.
std::int64_t DivideHalfUp(std::int64_t whole, std::int64_t remainder, std::int64_t divisor, bool negative) {
  auto rounded = whole;
  if (remainder * 2 >= divisor) {
    rounded = CheckedAdd(rounded, 1);
  }
  return negative ? -rounded : rounded;
}

// a * b / divisor with HALF_UP rounding, without overflowing on the
// intermediate product for values inside the DECIMAL(10,2) range.
std::int64_t MulDivHalfUp(std::int64_t a, std::int64_t b, std::int64_t divisor) {
  const bool negative = (a < 0) != (b < 0);
  const auto abs_a    = a < 0 ? -a : a;
  const auto abs_b    = b < 0 ? -b : b;

  const auto hi = abs_a / divisor;
  const auto lo = abs_a % divisor;

  auto       whole = CheckedMul(hi, abs_b);
  const auto tail  = CheckedMul(lo, abs_b);
  whole            = CheckedAdd(whole, tail / divisor);

  return DivideHalfUp(whole, tail % divisor, divisor, negative);
}

} // namespace

Decimal Decimal::Parse(std::string_view text) {
  if (text.empty()) {
    throw InvalidArgument("decimal value is empty");
  }

  bool        negative = false;
  std::size_t pos      = 0;
  if (text[0] == '-' || text[0] == '+') {
    negative = text[0] == '-';
    ++pos;
  }

  std::int64_t whole       = 0;
  std::int64_t fraction    = 0;
  int          frac_digits = 0;
  bool         any_digit   = false;
  bool         in_fraction = false;

  for (; pos < text.size(); ++pos) {
    const char c = text[pos];
    if (c == '.' && !in_fraction) {
      in_fraction = true;
      continue;
    }
    if (c < '0' || c > '9') {
      throw InvalidArgument("invalid decimal value '" + std::string(text) + "'");
    }
    any_digit = true;
    if (in_fraction) {
      if (++frac_digits > 2) {
        throw InvalidArgument("decimal value '" + std::string(text) + "' has more than two fractional digits");
      }
      fraction = fraction * 10 + (c - '0');
    } else {
      whole = CheckedAdd(CheckedMul(whole, 10), c - '0');
    }
  }

  if (!any_digit) {
    throw InvalidArgument("invalid decimal value '" + std::string(text) + "'");
  }
  if (frac_digits == 1) {
    fraction *= 10;
  }

  const auto units = CheckedAdd(CheckedMul(whole, kScale), fraction);
  return Decimal(negative ? -units : units);
}

std::string Decimal::ToString() const {
  const bool negative = units_ < 0;
  const auto abs      = negative ? -units_ : units_;
  const auto fraction = abs % kScale;

  std::string out = negative ? "-" : "";
  out += std::to_string(abs / kScale);
  out += '.';
  if (fraction < 10) {
    out += '0';
  }
  out += std::to_string(fraction);
  return out;
}

Decimal Decimal::Multiply(Decimal other) const {
  return Decimal(MulDivHalfUp(units_, other.units_, kScale));
}

Decimal Decimal::Percent(Decimal rate) const {
  return Decimal(MulDivHalfUp(units_, rate.units_, kScale * 100));
}

Decimal Decimal::operator+(Decimal other) const {
  return Decimal(CheckedAdd(units_, other.units_));
}

Decimal Decimal::operator-(Decimal other) const {
  return Decimal(CheckedAdd(units_, -other.units_));
}

Decimal& Decimal::operator+=(Decimal other) {
  units_ = CheckedAdd(units_, other.units_);
  return *this;
}

Decimal& Decimal::operator-=(Decimal other) {
  units_ = CheckedAdd(units_, -other.units_);
  return *this;
}

} // namespace docflow::util
