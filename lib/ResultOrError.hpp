#ifndef POW_LEDGER_RESULT_OR_ERROR_HPP
#define POW_LEDGER_RESULT_OR_ERROR_HPP

#include <cstdint>
#include <new>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

namespace pl {

/**
 * Common base for error payloads carried by ResultOrError.
 * Components derive their own Error struct from it so that error values
 * from different modules stay distinct types.
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

/**
 * Holds either a value of type T or an error of type E.
 *
 * Both sides convert implicitly so a function can `return value;` or
 * `return Error(code, "...");`. Accessing the wrong side throws
 * std::logic_error.
 */
template <typename T, typename E = RoeErrorBase> class ResultOrError {
  static_assert(!std::is_same<T, E>::value,
                "value and error types must differ");

public:
  ResultOrError(const T &value) : hasValue_(true) { new (&value_) T(value); }
  ResultOrError(T &&value) : hasValue_(true) {
    new (&value_) T(std::move(value));
  }
  ResultOrError(const E &err) : hasValue_(false) { new (&error_) E(err); }
  ResultOrError(E &&err) : hasValue_(false) { new (&error_) E(std::move(err)); }

  ResultOrError(const ResultOrError &other) : hasValue_(other.hasValue_) {
    if (hasValue_) {
      new (&value_) T(other.value_);
    } else {
      new (&error_) E(other.error_);
    }
  }

  ResultOrError(ResultOrError &&other) noexcept : hasValue_(other.hasValue_) {
    if (hasValue_) {
      new (&value_) T(std::move(other.value_));
    } else {
      new (&error_) E(std::move(other.error_));
    }
  }

  ResultOrError &operator=(ResultOrError other) noexcept {
    destroy();
    hasValue_ = other.hasValue_;
    if (hasValue_) {
      new (&value_) T(std::move(other.value_));
    } else {
      new (&error_) E(std::move(other.error_));
    }
    return *this;
  }

  ~ResultOrError() { destroy(); }

  bool isOk() const { return hasValue_; }
  bool isError() const { return !hasValue_; }
  explicit operator bool() const { return hasValue_; }

  const T &value() const {
    if (!hasValue_) {
      throw std::logic_error("ResultOrError: value() called on error result");
    }
    return value_;
  }

  T &value() {
    if (!hasValue_) {
      throw std::logic_error("ResultOrError: value() called on error result");
    }
    return value_;
  }

  T valueOr(const T &fallback) const { return hasValue_ ? value_ : fallback; }

  const E &error() const {
    if (hasValue_) {
      throw std::logic_error("ResultOrError: error() called on success result");
    }
    return error_;
  }

  const T &operator*() const { return value(); }
  T &operator*() { return value(); }
  const T *operator->() const { return &value(); }
  T *operator->() { return &value(); }

private:
  void destroy() {
    if (hasValue_) {
      value_.~T();
    } else {
      error_.~E();
    }
  }

  bool hasValue_;
  union {
    T value_;
    E error_;
  };
};

// Success carries no payload
template <typename E> class ResultOrError<void, E> {
public:
  ResultOrError() : hasValue_(true) {}
  ResultOrError(const E &err) : hasValue_(false), error_(err) {}
  ResultOrError(E &&err) : hasValue_(false), error_(std::move(err)) {}

  bool isOk() const { return hasValue_; }
  bool isError() const { return !hasValue_; }
  explicit operator bool() const { return hasValue_; }

  const E &error() const {
    if (hasValue_) {
      throw std::logic_error("ResultOrError: error() called on success result");
    }
    return error_;
  }

private:
  bool hasValue_;
  E error_;
};

} // namespace pl

#endif // POW_LEDGER_RESULT_OR_ERROR_HPP
