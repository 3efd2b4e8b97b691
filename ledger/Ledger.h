#ifndef TXLEDGER_LEDGER_H
#define TXLEDGER_LEDGER_H

#include "Decimal.h"
#include "Ids.h"
#include "Module.h"
#include "ResultOrError.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <unordered_map>

namespace txl {

/**
 * Ledger - history of every deposit processed during a run and whether it
 * is currently under dispute. Deposits are the only transactions that
 * dispute, resolve and chargeback can refer to; withdrawals leave no entry.
 *
 * Entries are never removed: a charged-back deposit keeps its disputed flag
 * so it can still be looked up.
 */
class Ledger : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };
  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_DUPLICATE_TX = 10;

  struct DepositRecord {
    ClientId client;
    PositiveAmount amount;
    bool disputed{ false };
  };

  Ledger();
  ~Ledger() override = default;

  /** Record a new, undisputed deposit. Fails if `tx` is already present. */
  Roe<void> recordDeposit(TransactionId tx, ClientId client, const PositiveAmount &amount);

  std::optional<DepositRecord> lookup(TransactionId tx) const;
  bool contains(TransactionId tx) const;

  // No-ops for unknown ids; callers check existence and state first
  void markDisputed(TransactionId tx);
  void markResolved(TransactionId tx);

  size_t size() const;

private:
  std::unordered_map<TransactionId, DepositRecord> mDeposits_;
};

} // namespace txl

#endif // TXLEDGER_LEDGER_H
