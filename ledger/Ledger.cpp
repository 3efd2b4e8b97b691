#include "Ledger.h"

namespace txl {

Ledger::Ledger() : Module("txledger.ledger") {}

Ledger::Roe<void> Ledger::recordDeposit(TransactionId tx, ClientId client,
                                        const PositiveAmount &amount) {
  auto result = mDeposits_.emplace(tx, DepositRecord{ client, amount, false });
  if (!result.second) {
    return Error(E_DUPLICATE_TX, "Duplicate transaction id: " + std::to_string(tx.value()));
  }
  log().debug << "Recorded deposit tx=" << tx << " client=" << client << " amount=" << amount;
  return {};
}

std::optional<Ledger::DepositRecord> Ledger::lookup(TransactionId tx) const {
  auto it = mDeposits_.find(tx);
  if (it == mDeposits_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool Ledger::contains(TransactionId tx) const { return mDeposits_.find(tx) != mDeposits_.end(); }

void Ledger::markDisputed(TransactionId tx) {
  auto it = mDeposits_.find(tx);
  if (it != mDeposits_.end()) {
    it->second.disputed = true;
  }
}

void Ledger::markResolved(TransactionId tx) {
  auto it = mDeposits_.find(tx);
  if (it != mDeposits_.end()) {
    it->second.disputed = false;
  }
}

size_t Ledger::size() const { return mDeposits_.size(); }

} // namespace txl
