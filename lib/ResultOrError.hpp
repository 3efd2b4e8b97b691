#ifndef TXLEDGER_RESULT_OR_ERROR_HPP
#define TXLEDGER_RESULT_OR_ERROR_HPP

#include <cstdint>
#include <new>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

namespace txl {

/**
 * Common base for component error types.
 * Components derive their own `Error` from it so that errors of different
 * components are distinct types while sharing the code/message layout.
 */
struct RoeErrorBase {
  int32_t code{ 0 };
  std::string message;

  RoeErrorBase() = default;
  RoeErrorBase(int32_t c, const std::string &msg) : code(c), message(msg) {}
  RoeErrorBase(int32_t c, std::string &&msg) : code(c), message(std::move(msg)) {}
  explicit RoeErrorBase(const std::string &msg) : code(-1), message(msg) {}
  explicit RoeErrorBase(std::string &&msg) : code(-1), message(std::move(msg)) {}
};

template <typename T, typename E = RoeErrorBase> class ResultOrError {
public:
  ResultOrError(const T &value) : hasValue_(true) { new (&storage_) T(value); }
  ResultOrError(T &&value) : hasValue_(true) { new (&storage_) T(std::move(value)); }

  ResultOrError(const E &err) : hasValue_(false) { new (&storage_) E(err); }
  ResultOrError(E &&err) : hasValue_(false) { new (&storage_) E(std::move(err)); }

  static ResultOrError error(const E &err) { return ResultOrError(err); }
  static ResultOrError error(E &&err) { return ResultOrError(std::move(err)); }

  ResultOrError(const ResultOrError &other) : hasValue_(other.hasValue_) {
    if (hasValue_) {
      new (&storage_) T(other.valueRef());
    } else {
      new (&storage_) E(other.errorRef());
    }
  }

  ResultOrError(ResultOrError &&other) noexcept : hasValue_(other.hasValue_) {
    if (hasValue_) {
      new (&storage_) T(std::move(other.valueRef()));
    } else {
      new (&storage_) E(std::move(other.errorRef()));
    }
  }

  ~ResultOrError() { destroy(); }

  ResultOrError &operator=(const ResultOrError &other) {
    if (this != &other) {
      destroy();
      hasValue_ = other.hasValue_;
      if (hasValue_) {
        new (&storage_) T(other.valueRef());
      } else {
        new (&storage_) E(other.errorRef());
      }
    }
    return *this;
  }

  ResultOrError &operator=(ResultOrError &&other) noexcept {
    if (this != &other) {
      destroy();
      hasValue_ = other.hasValue_;
      if (hasValue_) {
        new (&storage_) T(std::move(other.valueRef()));
      } else {
        new (&storage_) E(std::move(other.errorRef()));
      }
    }
    return *this;
  }

  bool isOk() const { return hasValue_; }
  bool isError() const { return !hasValue_; }
  explicit operator bool() const { return hasValue_; }

  const T &value() const {
    if (!hasValue_) {
      throw std::runtime_error("Attempting to access value of error result");
    }
    return valueRef();
  }

  T &value() {
    if (!hasValue_) {
      throw std::runtime_error("Attempting to access value of error result");
    }
    return valueRef();
  }

  T valueOr(const T &defaultValue) const {
    return hasValue_ ? valueRef() : defaultValue;
  }

  const E &error() const {
    if (hasValue_) {
      throw std::runtime_error("Attempting to access error of success result");
    }
    return errorRef();
  }

  E &error() {
    if (hasValue_) {
      throw std::runtime_error("Attempting to access error of success result");
    }
    return errorRef();
  }

  const T &operator*() const { return value(); }
  T &operator*() { return value(); }

  const T *operator->() const { return &value(); }
  T *operator->() { return &value(); }

private:
  T &valueRef() { return *reinterpret_cast<T *>(&storage_); }
  const T &valueRef() const { return *reinterpret_cast<const T *>(&storage_); }
  E &errorRef() { return *reinterpret_cast<E *>(&storage_); }
  const E &errorRef() const { return *reinterpret_cast<const E *>(&storage_); }

  void destroy() {
    if (hasValue_) {
      valueRef().~T();
    } else {
      errorRef().~E();
    }
  }

  bool hasValue_;
  typename std::aligned_union<0, T, E>::type storage_;
};

// Specialization for operations that only report success or failure
template <typename E> class ResultOrError<void, E> {
public:
  ResultOrError() : hasValue_(true) {}

  ResultOrError(const E &err) : hasValue_(false) { new (&storage_) E(err); }
  ResultOrError(E &&err) : hasValue_(false) { new (&storage_) E(std::move(err)); }

  static ResultOrError error(const E &err) { return ResultOrError(err); }
  static ResultOrError error(E &&err) { return ResultOrError(std::move(err)); }

  ResultOrError(const ResultOrError &other) : hasValue_(other.hasValue_) {
    if (!hasValue_) {
      new (&storage_) E(other.errorRef());
    }
  }

  ResultOrError(ResultOrError &&other) noexcept : hasValue_(other.hasValue_) {
    if (!hasValue_) {
      new (&storage_) E(std::move(other.errorRef()));
    }
  }

  ~ResultOrError() { destroy(); }

  ResultOrError &operator=(const ResultOrError &other) {
    if (this != &other) {
      destroy();
      hasValue_ = other.hasValue_;
      if (!hasValue_) {
        new (&storage_) E(other.errorRef());
      }
    }
    return *this;
  }

  ResultOrError &operator=(ResultOrError &&other) noexcept {
    if (this != &other) {
      destroy();
      hasValue_ = other.hasValue_;
      if (!hasValue_) {
        new (&storage_) E(std::move(other.errorRef()));
      }
    }
    return *this;
  }

  bool isOk() const { return hasValue_; }
  bool isError() const { return !hasValue_; }
  explicit operator bool() const { return hasValue_; }

  const E &error() const {
    if (hasValue_) {
      throw std::runtime_error("Attempting to access error of success result");
    }
    return errorRef();
  }

  E &error() {
    if (hasValue_) {
      throw std::runtime_error("Attempting to access error of success result");
    }
    return errorRef();
  }

private:
  E &errorRef() { return *reinterpret_cast<E *>(&storage_); }
  const E &errorRef() const { return *reinterpret_cast<const E *>(&storage_); }

  void destroy() {
    if (!hasValue_) {
      errorRef().~E();
    }
  }

  bool hasValue_;
  typename std::aligned_union<0, E>::type storage_;
};

} // namespace txl

#endif // TXLEDGER_RESULT_OR_ERROR_HPP
