#ifndef TXLEDGER_CLIENT_ACCOUNT_H
#define TXLEDGER_CLIENT_ACCOUNT_H

#include "Decimal.h"
#include "Ids.h"
#include "ResultOrError.hpp"

#include <cstdint>

namespace txl {

/**
 * Balances of one client. The total is always available + held and is
 * derived on demand. Every operation either applies completely or leaves the
 * account untouched; a locked account rejects all of them.
 */
class ClientAccount {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };
  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_ACCOUNT_LOCKED = 1;
  constexpr static int32_t E_INSUFFICIENT_FUNDS = 2;
  constexpr static int32_t E_OVERFLOW = 3;

  ClientAccount() = default;
  ~ClientAccount() = default;

  const Decimal &getAvailable() const { return available_; }
  const Decimal &getHeld() const { return held_; }
  Decimal getTotal() const;
  bool isLocked() const { return locked_; }

  Roe<void> ensureNotLocked() const;

  // Balance operations
  Roe<void> deposit(const PositiveAmount &amount);
  Roe<void> withdraw(const PositiveAmount &amount);

  // Moves `amount` from available to held
  Roe<void> hold(const PositiveAmount &amount);
  // Moves `amount` from held back to available
  Roe<void> release(const PositiveAmount &amount);
  // Removes `amount` from held and locks the account
  Roe<void> chargeback(const PositiveAmount &amount);

  bool operator==(const ClientAccount &other) const {
    return available_ == other.available_ && held_ == other.held_ && locked_ == other.locked_;
  }
  bool operator!=(const ClientAccount &other) const { return !(*this == other); }

private:
  Roe<void> moveFunds(Decimal &from, Decimal &to, const PositiveAmount &amount);

  Decimal available_;
  Decimal held_;
  bool locked_{ false };
};

/** One row of the final account table. */
struct AccountSummary {
  ClientId client;
  Decimal available;
  Decimal held;
  Decimal total;
  bool locked{ false };
};

} // namespace txl

#endif // TXLEDGER_CLIENT_ACCOUNT_H
