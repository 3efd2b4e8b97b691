#include "Transaction.h"

#include <sstream>
#include <type_traits>

namespace txl {

ClientId clientOf(const Transaction &transaction) {
  return std::visit([](const auto &t) { return t.client; }, transaction);
}

TransactionId txOf(const Transaction &transaction) {
  return std::visit([](const auto &t) { return t.tx; }, transaction);
}

const char *typeName(const Transaction &transaction) {
  static const char *const names[] = {"deposit", "withdrawal", "dispute", "resolve",
                                      "chargeback"};
  return names[transaction.index()];
}

std::string toString(const Transaction &transaction) {
  std::ostringstream ss;
  ss << typeName(transaction) << "{client=" << clientOf(transaction)
     << ", tx=" << txOf(transaction);
  std::visit(
      [&ss](const auto &t) {
        using T = std::decay_t<decltype(t)>;
        if constexpr (std::is_same_v<T, Deposit> || std::is_same_v<T, Withdrawal>) {
          ss << ", amount=" << t.amount;
        }
      },
      transaction);
  ss << "}";
  return ss.str();
}

std::ostream &operator<<(std::ostream &os, const Transaction &transaction) {
  return os << toString(transaction);
}

} // namespace txl
