#include "ClientAccount.h"

namespace txl {

Decimal ClientAccount::getTotal() const {
  // deposit() keeps available + held within range, so this cannot overflow
  return available_.checkedAdd(held_).valueOr(available_);
}

ClientAccount::Roe<void> ClientAccount::ensureNotLocked() const {
  if (locked_) {
    return Error(E_ACCOUNT_LOCKED, "Account is locked");
  }
  return {};
}

ClientAccount::Roe<void> ClientAccount::deposit(const PositiveAmount &amount) {
  auto lockCheck = ensureNotLocked();
  if (!lockCheck) {
    return lockCheck;
  }

  auto newAvailable = available_.checkedAdd(amount.value());
  if (!newAvailable || !newAvailable->checkedAdd(held_)) {
    return Error(E_OVERFLOW, "Deposit would cause balance overflow");
  }

  available_ = newAvailable.value();
  return {};
}

ClientAccount::Roe<void> ClientAccount::withdraw(const PositiveAmount &amount) {
  auto lockCheck = ensureNotLocked();
  if (!lockCheck) {
    return lockCheck;
  }

  if (available_ < amount.value()) {
    return Error(E_INSUFFICIENT_FUNDS, "Insufficient funds: available " + available_.toString() +
                                           ", requested " + amount.value().toString());
  }

  available_ = available_.checkedSub(amount.value()).value();
  return {};
}

ClientAccount::Roe<void> ClientAccount::hold(const PositiveAmount &amount) {
  return moveFunds(available_, held_, amount);
}

ClientAccount::Roe<void> ClientAccount::release(const PositiveAmount &amount) {
  return moveFunds(held_, available_, amount);
}

ClientAccount::Roe<void> ClientAccount::chargeback(const PositiveAmount &amount) {
  auto lockCheck = ensureNotLocked();
  if (!lockCheck) {
    return lockCheck;
  }

  auto newHeld = held_.checkedSub(amount.value());
  if (!newHeld) {
    return Error(E_OVERFLOW, "Chargeback would cause balance overflow");
  }

  held_ = newHeld.value();
  locked_ = true;
  return {};
}

ClientAccount::Roe<void> ClientAccount::moveFunds(Decimal &from, Decimal &to,
                                                  const PositiveAmount &amount) {
  auto lockCheck = ensureNotLocked();
  if (!lockCheck) {
    return lockCheck;
  }

  // No solvency check: a dispute may push available below zero
  auto newFrom = from.checkedSub(amount.value());
  auto newTo = to.checkedAdd(amount.value());
  if (!newFrom || !newTo) {
    return Error(E_OVERFLOW, "Moving funds would cause balance overflow");
  }

  from = newFrom.value();
  to = newTo.value();
  return {};
}

} // namespace txl
