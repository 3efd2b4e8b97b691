#ifndef TXLEDGER_IDS_H
#define TXLEDGER_IDS_H

#include <cstdint>
#include <functional>
#include <ostream>

namespace txl {

/**
 * Client identifier. Opaque: supports comparison and hashing only, and does
 * not convert implicitly to or from integers or transaction ids.
 */
class ClientId {
public:
  constexpr explicit ClientId(uint16_t value) : value_(value) {}

  constexpr uint16_t value() const { return value_; }

  constexpr bool operator==(const ClientId &other) const { return value_ == other.value_; }
  constexpr bool operator!=(const ClientId &other) const { return value_ != other.value_; }
  constexpr bool operator<(const ClientId &other) const { return value_ < other.value_; }

private:
  uint16_t value_;
};

/**
 * Transaction identifier, globally unique per deposit/withdrawal.
 */
class TransactionId {
public:
  constexpr explicit TransactionId(uint32_t value) : value_(value) {}

  constexpr uint32_t value() const { return value_; }

  constexpr bool operator==(const TransactionId &other) const { return value_ == other.value_; }
  constexpr bool operator!=(const TransactionId &other) const { return value_ != other.value_; }
  constexpr bool operator<(const TransactionId &other) const { return value_ < other.value_; }

private:
  uint32_t value_;
};

inline std::ostream &operator<<(std::ostream &os, const ClientId &id) {
  return os << id.value();
}

inline std::ostream &operator<<(std::ostream &os, const TransactionId &id) {
  return os << id.value();
}

} // namespace txl

namespace std {

template <> struct hash<txl::ClientId> {
  size_t operator()(const txl::ClientId &id) const noexcept {
    return hash<uint16_t>()(id.value());
  }
};

template <> struct hash<txl::TransactionId> {
  size_t operator()(const txl::TransactionId &id) const noexcept {
    return hash<uint32_t>()(id.value());
  }
};

} // namespace std

#endif // TXLEDGER_IDS_H
