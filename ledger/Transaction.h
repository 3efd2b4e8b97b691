#ifndef TXLEDGER_TRANSACTION_H
#define TXLEDGER_TRANSACTION_H

#include "Decimal.h"
#include "Ids.h"

#include <ostream>
#include <string>
#include <variant>

namespace txl {

struct Deposit {
  ClientId client;
  TransactionId tx;
  PositiveAmount amount;
};

struct Withdrawal {
  ClientId client;
  TransactionId tx;
  PositiveAmount amount;
};

// Dispute-family records reference an earlier deposit by its id
struct Dispute {
  ClientId client;
  TransactionId tx;
};

struct Resolve {
  ClientId client;
  TransactionId tx;
};

struct Chargeback {
  ClientId client;
  TransactionId tx;
};

using Transaction = std::variant<Deposit, Withdrawal, Dispute, Resolve, Chargeback>;

ClientId clientOf(const Transaction &transaction);
TransactionId txOf(const Transaction &transaction);

// Lower-case type tag as it appears in input files ("deposit", ...)
const char *typeName(const Transaction &transaction);

std::string toString(const Transaction &transaction);

std::ostream &operator<<(std::ostream &os, const Transaction &transaction);

} // namespace txl

#endif // TXLEDGER_TRANSACTION_H
