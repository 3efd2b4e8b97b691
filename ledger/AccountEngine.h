#ifndef TXLEDGER_ACCOUNT_ENGINE_H
#define TXLEDGER_ACCOUNT_ENGINE_H

#include "ClientAccount.h"
#include "Ledger.h"
#include "Module.h"
#include "ResultOrError.hpp"
#include "Transaction.h"

#include <cstdint>
#include <map>
#include <vector>

namespace txl {

/**
 * AccountEngine - applies transactions, one at a time and in the order
 * given, to the accounts of the clients they name.
 *
 * Accounts are created on first reference. Deposits and withdrawals that
 * break a rule are rejected with an error; dispute, resolve and chargeback
 * records that point at an unknown deposit, another client's deposit, or a
 * deposit in the wrong dispute state are ignored without error, as are those
 * whose balance move would leave the representable range. Any
 * transaction for a locked account is rejected with E_ACCOUNT_LOCKED.
 * Rejected and ignored transactions never change state.
 */
class AccountEngine : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };
  template <typename T> using Roe = ResultOrError<T, Error>;

  // Codes are shared with the component that detects the condition
  constexpr static int32_t E_ACCOUNT_LOCKED = ClientAccount::E_ACCOUNT_LOCKED;
  constexpr static int32_t E_INSUFFICIENT_FUNDS = ClientAccount::E_INSUFFICIENT_FUNDS;
  constexpr static int32_t E_OVERFLOW = ClientAccount::E_OVERFLOW;
  constexpr static int32_t E_DUPLICATE_TX = Ledger::E_DUPLICATE_TX;
  constexpr static int32_t E_ACCOUNT_NOT_FOUND = 20;

  enum class Outcome {
    APPLIED, // state changed
    IGNORED, // dispute-family reference could not be resolved
  };

  struct Stats {
    uint64_t processed{ 0 };
    uint64_t applied{ 0 };
    uint64_t ignored{ 0 };
    uint64_t rejected{ 0 };
    std::map<int32_t, uint64_t> rejectedByCode;
  };

  AccountEngine();
  ~AccountEngine() override = default;

  /**
   * Apply one transaction.
   * @return the outcome, or the reason the transaction was rejected
   */
  Roe<Outcome> apply(const Transaction &transaction);

  bool hasAccount(ClientId client) const;
  Roe<ClientAccount> getAccount(ClientId client) const;
  size_t getAccountCount() const;

  /** One summary per client seen, in ascending client id order. */
  std::vector<AccountSummary> summaries() const;

  const Ledger &getLedger() const { return ledger_; }
  const Stats &getStats() const { return stats_; }

private:
  ClientAccount &accountFor(ClientId client);

  Roe<Outcome> applyOne(const Deposit &deposit);
  Roe<Outcome> applyOne(const Withdrawal &withdrawal);
  Roe<Outcome> applyOne(const Dispute &dispute);
  Roe<Outcome> applyOne(const Resolve &resolve);
  Roe<Outcome> applyOne(const Chargeback &chargeback);

  // Deposit referenced by a dispute-family record, if it belongs to `client`
  std::optional<Ledger::DepositRecord> findClientDeposit(ClientId client,
                                                         TransactionId tx) const;

  Roe<Outcome> ignore(const char *reason, ClientId client, TransactionId tx);

  Ledger ledger_;
  std::map<ClientId, ClientAccount> mAccounts_;
  Stats stats_;
};

} // namespace txl

#endif // TXLEDGER_ACCOUNT_ENGINE_H
