#include "Decimal.h"

#include <limits>

namespace txl {

namespace {

constexpr int64_t MAX_UNITS = std::numeric_limits<int64_t>::max();
constexpr int64_t MIN_UNITS = std::numeric_limits<int64_t>::min();

bool isDigit(char c) { return c >= '0' && c <= '9'; }

} // namespace

Decimal::Roe<Decimal> Decimal::parse(const std::string &str) {
  if (str.empty()) {
    return Error(E_PARSE, "Empty decimal value");
  }

  size_t pos = 0;
  bool negative = false;
  if (str[pos] == '-' || str[pos] == '+') {
    negative = str[pos] == '-';
    ++pos;
  }

  std::string wholeDigits;
  while (pos < str.size() && isDigit(str[pos])) {
    wholeDigits.push_back(str[pos++]);
  }

  std::string fracDigits;
  if (pos < str.size() && str[pos] == '.') {
    ++pos;
    while (pos < str.size() && isDigit(str[pos])) {
      fracDigits.push_back(str[pos++]);
    }
  }

  if (pos != str.size() || (wholeDigits.empty() && fracDigits.empty())) {
    return Error(E_PARSE, "Invalid decimal value: '" + str + "'");
  }

  for (size_t i = FRACTION_DIGITS; i < fracDigits.size(); ++i) {
    if (fracDigits[i] != '0') {
      return Error(E_PRECISION, "More than 4 fractional digits: '" + str + "'");
    }
  }
  if (fracDigits.size() > static_cast<size_t>(FRACTION_DIGITS)) {
    fracDigits.resize(FRACTION_DIGITS);
  }
  while (fracDigits.size() < static_cast<size_t>(FRACTION_DIGITS)) {
    fracDigits.push_back('0');
  }

  int64_t fraction = 0;
  for (char c : fracDigits) {
    fraction = fraction * 10 + (c - '0');
  }

  int64_t whole = 0;
  for (char c : wholeDigits) {
    int digit = c - '0';
    if (whole > (MAX_UNITS / SCALE - digit) / 10) {
      return Error(E_OVERFLOW, "Decimal value out of range: '" + str + "'");
    }
    whole = whole * 10 + digit;
  }

  if (whole > (MAX_UNITS - fraction) / SCALE) {
    return Error(E_OVERFLOW, "Decimal value out of range: '" + str + "'");
  }

  int64_t units = whole * SCALE + fraction;
  return Decimal(negative ? -units : units);
}

Decimal::Roe<Decimal> Decimal::checkedAdd(const Decimal &other) const {
  if ((other.units_ > 0 && units_ > MAX_UNITS - other.units_) ||
      (other.units_ < 0 && units_ < MIN_UNITS - other.units_)) {
    return Error(E_OVERFLOW, "Decimal addition overflow");
  }
  return Decimal(units_ + other.units_);
}

Decimal::Roe<Decimal> Decimal::checkedSub(const Decimal &other) const {
  if ((other.units_ < 0 && units_ > MAX_UNITS + other.units_) ||
      (other.units_ > 0 && units_ < MIN_UNITS + other.units_)) {
    return Error(E_OVERFLOW, "Decimal subtraction overflow");
  }
  return Decimal(units_ - other.units_);
}

std::string Decimal::toString() const {
  uint64_t magnitude = units_ < 0 ? static_cast<uint64_t>(-(units_ + 1)) + 1
                                  : static_cast<uint64_t>(units_);
  uint64_t whole = magnitude / SCALE;
  std::string fraction = std::to_string(magnitude % SCALE);
  fraction.insert(0, FRACTION_DIGITS - fraction.size(), '0');

  std::string out = units_ < 0 ? "-" : "";
  out += std::to_string(whole);
  out += '.';
  out += fraction;
  return out;
}

PositiveAmount::Roe<PositiveAmount> PositiveAmount::create(const Decimal &value) {
  if (value.isNegative()) {
    return Error(Decimal::E_INVALID_AMOUNT, "Amount must be positive, got " + value.toString());
  }
  if (value.isZero()) {
    return Error(Decimal::E_INVALID_AMOUNT, "Amount must be non-zero");
  }
  return PositiveAmount(value);
}

PositiveAmount::Roe<PositiveAmount> PositiveAmount::parse(const std::string &str) {
  auto decimal = Decimal::parse(str);
  if (!decimal) {
    return decimal.error();
  }
  return create(decimal.value());
}

std::ostream &operator<<(std::ostream &os, const Decimal &value) {
  return os << value.toString();
}

std::ostream &operator<<(std::ostream &os, const PositiveAmount &amount) {
  return os << amount.value();
}

} // namespace txl
