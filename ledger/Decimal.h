#ifndef TXLEDGER_DECIMAL_H
#define TXLEDGER_DECIMAL_H

#include "ResultOrError.hpp"

#include <cstdint>
#include <ostream>
#include <string>

namespace txl {

/**
 * Signed fixed-point decimal with four fractional digits, stored as a count
 * of 1/10000 units in a 64-bit integer. Arithmetic is exact; operations that
 * would leave the 64-bit range report E_OVERFLOW instead of wrapping.
 */
class Decimal {
public:
  constexpr static int32_t FRACTION_DIGITS = 4;
  constexpr static int64_t SCALE = 10000;

  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };
  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_PARSE = 1;
  constexpr static int32_t E_PRECISION = 2;
  constexpr static int32_t E_OVERFLOW = 3;
  constexpr static int32_t E_INVALID_AMOUNT = 4;

  constexpr Decimal() : units_(0) {}

  static constexpr Decimal fromUnits(int64_t units) { return Decimal(units); }

  /**
   * Parse a plain decimal literal such as "12", "-3.5" or ".0001".
   * Digits beyond the fourth fractional place must be zeros.
   */
  static Roe<Decimal> parse(const std::string &str);

  constexpr int64_t units() const { return units_; }

  constexpr bool isZero() const { return units_ == 0; }
  constexpr bool isNegative() const { return units_ < 0; }
  constexpr bool isPositive() const { return units_ > 0; }

  Roe<Decimal> checkedAdd(const Decimal &other) const;
  Roe<Decimal> checkedSub(const Decimal &other) const;

  // Always renders four fractional digits, e.g. "-1.5000"
  std::string toString() const;

  constexpr bool operator==(const Decimal &other) const { return units_ == other.units_; }
  constexpr bool operator!=(const Decimal &other) const { return units_ != other.units_; }
  constexpr bool operator<(const Decimal &other) const { return units_ < other.units_; }
  constexpr bool operator<=(const Decimal &other) const { return units_ <= other.units_; }
  constexpr bool operator>(const Decimal &other) const { return units_ > other.units_; }
  constexpr bool operator>=(const Decimal &other) const { return units_ >= other.units_; }

private:
  constexpr explicit Decimal(int64_t units) : units_(units) {}

  int64_t units_;
};

/**
 * A Decimal known to be strictly greater than zero. The only way to obtain
 * one is through create()/parse(), which reject zero and negative values
 * with E_INVALID_AMOUNT.
 */
class PositiveAmount {
public:
  using Error = Decimal::Error;
  template <typename T> using Roe = ResultOrError<T, Error>;

  static Roe<PositiveAmount> create(const Decimal &value);
  static Roe<PositiveAmount> parse(const std::string &str);

  const Decimal &value() const { return value_; }

  bool operator==(const PositiveAmount &other) const { return value_ == other.value_; }
  bool operator!=(const PositiveAmount &other) const { return value_ != other.value_; }

private:
  explicit PositiveAmount(const Decimal &value) : value_(value) {}

  Decimal value_;
};

std::ostream &operator<<(std::ostream &os, const Decimal &value);
std::ostream &operator<<(std::ostream &os, const PositiveAmount &amount);

} // namespace txl

#endif // TXLEDGER_DECIMAL_H
