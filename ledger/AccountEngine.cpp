#include "AccountEngine.h"

namespace txl {

AccountEngine::AccountEngine() : Module("txledger.engine") {
  ledger_.redirectLogger(log().getFullName());
}

AccountEngine::Roe<AccountEngine::Outcome> AccountEngine::apply(const Transaction &transaction) {
  ++stats_.processed;

  auto result = std::visit([this](const auto &t) { return applyOne(t); }, transaction);
  if (!result) {
    ++stats_.rejected;
    ++stats_.rejectedByCode[result.error().code];
    log().debug << "Rejected " << transaction << ": " << result.error().message;
    return result;
  }

  if (result.value() == Outcome::APPLIED) {
    ++stats_.applied;
    log().debug << "Applied " << transaction;
  } else {
    ++stats_.ignored;
  }
  return result;
}

bool AccountEngine::hasAccount(ClientId client) const {
  return mAccounts_.find(client) != mAccounts_.end();
}

AccountEngine::Roe<ClientAccount> AccountEngine::getAccount(ClientId client) const {
  auto it = mAccounts_.find(client);
  if (it == mAccounts_.end()) {
    return Error(E_ACCOUNT_NOT_FOUND, "Account not found: " + std::to_string(client.value()));
  }
  return it->second;
}

size_t AccountEngine::getAccountCount() const { return mAccounts_.size(); }

std::vector<AccountSummary> AccountEngine::summaries() const {
  std::vector<AccountSummary> rows;
  rows.reserve(mAccounts_.size());
  for (const auto &[client, account] : mAccounts_) {
    rows.push_back(AccountSummary{ client, account.getAvailable(), account.getHeld(),
                                   account.getTotal(), account.isLocked() });
  }
  return rows;
}

ClientAccount &AccountEngine::accountFor(ClientId client) {
  auto it = mAccounts_.find(client);
  if (it == mAccounts_.end()) {
    it = mAccounts_.emplace(client, ClientAccount()).first;
    log().debug << "Created account for client " << client;
  }
  return it->second;
}

AccountEngine::Roe<AccountEngine::Outcome> AccountEngine::applyOne(const Deposit &deposit) {
  auto &account = accountFor(deposit.client);

  auto lockCheck = account.ensureNotLocked();
  if (!lockCheck) {
    return Error(lockCheck.error().code, lockCheck.error().message);
  }

  if (ledger_.contains(deposit.tx)) {
    return Error(E_DUPLICATE_TX, "Duplicate transaction id: " + std::to_string(deposit.tx.value()));
  }

  auto depositResult = account.deposit(deposit.amount);
  if (!depositResult) {
    return Error(depositResult.error().code, depositResult.error().message);
  }

  auto recordResult = ledger_.recordDeposit(deposit.tx, deposit.client, deposit.amount);
  if (!recordResult) {
    return Error(recordResult.error().code, recordResult.error().message);
  }
  return Outcome::APPLIED;
}

AccountEngine::Roe<AccountEngine::Outcome> AccountEngine::applyOne(const Withdrawal &withdrawal) {
  auto &account = accountFor(withdrawal.client);

  auto lockCheck = account.ensureNotLocked();
  if (!lockCheck) {
    return Error(lockCheck.error().code, lockCheck.error().message);
  }

  // Withdrawal ids share the id space of recorded deposits
  if (ledger_.contains(withdrawal.tx)) {
    return Error(E_DUPLICATE_TX,
                 "Duplicate transaction id: " + std::to_string(withdrawal.tx.value()));
  }

  auto withdrawResult = account.withdraw(withdrawal.amount);
  if (!withdrawResult) {
    return Error(withdrawResult.error().code, withdrawResult.error().message);
  }
  return Outcome::APPLIED;
}

AccountEngine::Roe<AccountEngine::Outcome> AccountEngine::applyOne(const Dispute &dispute) {
  auto &account = accountFor(dispute.client);

  auto lockCheck = account.ensureNotLocked();
  if (!lockCheck) {
    return Error(lockCheck.error().code, lockCheck.error().message);
  }

  auto record = findClientDeposit(dispute.client, dispute.tx);
  if (!record) {
    return ignore("no such deposit for client", dispute.client, dispute.tx);
  }
  if (record->disputed) {
    return ignore("deposit already disputed", dispute.client, dispute.tx);
  }

  auto holdResult = account.hold(record->amount);
  if (!holdResult) {
    return ignore("balance out of range", dispute.client, dispute.tx);
  }
  ledger_.markDisputed(dispute.tx);
  return Outcome::APPLIED;
}

AccountEngine::Roe<AccountEngine::Outcome> AccountEngine::applyOne(const Resolve &resolve) {
  auto &account = accountFor(resolve.client);

  auto lockCheck = account.ensureNotLocked();
  if (!lockCheck) {
    return Error(lockCheck.error().code, lockCheck.error().message);
  }

  auto record = findClientDeposit(resolve.client, resolve.tx);
  if (!record) {
    return ignore("no such deposit for client", resolve.client, resolve.tx);
  }
  if (!record->disputed) {
    return ignore("deposit not disputed", resolve.client, resolve.tx);
  }

  auto releaseResult = account.release(record->amount);
  if (!releaseResult) {
    return ignore("balance out of range", resolve.client, resolve.tx);
  }
  ledger_.markResolved(resolve.tx);
  return Outcome::APPLIED;
}

AccountEngine::Roe<AccountEngine::Outcome> AccountEngine::applyOne(const Chargeback &chargeback) {
  auto &account = accountFor(chargeback.client);

  auto lockCheck = account.ensureNotLocked();
  if (!lockCheck) {
    return Error(lockCheck.error().code, lockCheck.error().message);
  }

  auto record = findClientDeposit(chargeback.client, chargeback.tx);
  if (!record) {
    return ignore("no such deposit for client", chargeback.client, chargeback.tx);
  }
  if (!record->disputed) {
    return ignore("deposit not disputed", chargeback.client, chargeback.tx);
  }

  // The ledger entry stays marked as disputed
  auto chargebackResult = account.chargeback(record->amount);
  if (!chargebackResult) {
    return ignore("balance out of range", chargeback.client, chargeback.tx);
  }
  log().info << "Client " << chargeback.client << " locked by chargeback of tx "
             << chargeback.tx;
  return Outcome::APPLIED;
}

std::optional<Ledger::DepositRecord> AccountEngine::findClientDeposit(ClientId client,
                                                                      TransactionId tx) const {
  auto record = ledger_.lookup(tx);
  if (!record || record->client != client) {
    return std::nullopt;
  }
  return record;
}

AccountEngine::Roe<AccountEngine::Outcome> AccountEngine::ignore(const char *reason,
                                                                 ClientId client,
                                                                 TransactionId tx) {
  log().debug << "Ignored reference to tx " << tx << " from client " << client << ": "
              << reason;
  return Outcome::IGNORED;
}

} // namespace txl
