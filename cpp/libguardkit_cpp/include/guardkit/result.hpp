/**
 * @file result.hpp
 * @brief Result<T> for guardkit APIs, with lazy messages and suppressed errors.
 *
 * Result<T> conveys success or failure of an operation. On success it holds
 * a value; on failure it carries an ErrorCode and a message built on first
 * access. A failed Result can also collect secondary failures that happened
 * while cleaning up after the primary one (for example a close error after a
 * write error). These are kept in Suppressed() and never replace the primary
 * error.
 *
 * Usage example
 * @code{.cpp}
 * guardkit::Result<void> r = guardkit::WriteFile("out.bin", data, size);
 * if (!r) {
 *   fprintf(stderr, "%s\n", r.Message().c_str());
 *   for (size_t i = 0; i < r.Suppressed().size(); ++i)
 *     fprintf(stderr, "  suppressed: %s\n", r.Suppressed()[i].message.c_str());
 * }
 * @endcode
 */
#pragma once

#include <functional>
#include <string>
#include <utility>
#include <vector>

#include "guardkit/error.hpp"

namespace guardkit {

/** A secondary failure recorded on a failed Result. */
struct SuppressedError {
  ErrorCode code;
  std::string message;
};

namespace detail {
/** Stores error code and lazily materializes message via factory. */
struct ErrorDetail {
  ErrorCode code = ErrorCode::kSuccess;
  mutable std::string message;  // materialized on first access
  mutable std::function<std::string()> message_factory;  // may be empty
  std::vector<SuppressedError> suppressed;

  ErrorDetail() = default;
  explicit ErrorDetail(ErrorCode c) : code(c) {}
  ErrorDetail(ErrorCode c, std::function<std::string()> factory)
      : code(c), message_factory(std::move(factory)) {}

  const std::string& Message() const {
    if (message.empty() && message_factory) {
      message = message_factory();
      message_factory = std::function<std::string()>();
    }
    if (message.empty()) {
      message = ErrorCodeToString(code);
    }
    return message;
  }
};
}  // namespace detail

/**
 * @brief Result type carrying either T or an error.
 * @tparam T Success value type. Must be default-constructible.
 */
template <typename T>
class Result {
 public:
  /** Construct a successful Result with a copy of value. */
  Result(const T& value) : ok_(true), value_(value) {}
  /** Construct a successful Result moving the value. */
  Result(T&& value) : ok_(true), value_(std::move(value)) {}

  /** Construct an error Result with code and optional message factory. */
  Result(ErrorCode code, std::function<std::string()> msg_factory = {})
      : ok_(false), error_(code, std::move(msg_factory)) {}

  static Result<T> Ok(T value) { return Result<T>(std::move(value)); }
  static Result<T> Error(ErrorCode code,
                         std::function<std::string()> msg_factory = {}) {
    return Result<T>(code, std::move(msg_factory));
  }

  /**
   * @brief Carry the error of a failed Result of another type.
   * @note @p other must have failed; code, message and suppressed errors are
   *       copied.
   */
  template <typename U>
  static Result<T> From(const Result<U>& other) {
    Result<T> r(other.Code());
    r.error_.message = other.Message();
    r.error_.suppressed = other.Suppressed();
    return r;
  }

  explicit operator bool() const noexcept { return ok_; }

  /** @return ErrorCode::kSuccess on ok, otherwise the stored code. */
  ErrorCode Code() const noexcept {
    return ok_ ? ErrorCode::kSuccess : error_.code;
  }

  /**
   * @brief Retrieve the error message, constructing it on first use.
   * @note Returns an empty string on success.
   */
  const std::string& Message() const {
    static const std::string kEmpty;
    return ok_ ? kEmpty : error_.Message();
  }

  /** Secondary failures attached with Suppress(). Empty on success. */
  const std::vector<SuppressedError>& Suppressed() const {
    return error_.suppressed;
  }

  /**
   * @brief Attach @p other as a suppressed error if it failed.
   * @note No effect when this Result succeeded or @p other succeeded.
   */
  template <typename U>
  void Suppress(const Result<U>& other) {
    if (ok_ || other) return;
    SuppressedError e;
    e.code = other.Code();
    e.message = other.Message();
    error_.suppressed.push_back(e);
  }

  /** @name Value access (valid only when ok_) */
  ///@{
  T& Value() { return value_; }
  const T& Value() const { return value_; }

  T* operator->() { return &value_; }
  const T* operator->() const { return &value_; }

  T& operator*() { return value_; }
  const T& operator*() const { return value_; }

  T&& MoveValue() { return std::move(value_); }
  ///@}

 private:
  bool ok_ = false;
  T value_{};
  detail::ErrorDetail error_{};
};

/** Specialization for void results. */
template <>
class Result<void> {
 public:
  Result() : ok_(true) {}
  explicit Result(ErrorCode code,
                  std::function<std::string()> msg_factory = {})
      : ok_(false), error_(code, std::move(msg_factory)) {}

  static Result<void> Ok() { return Result<void>(); }
  static Result<void> Error(ErrorCode code,
                            std::function<std::string()> msg_factory = {}) {
    return Result<void>(code, std::move(msg_factory));
  }

  template <typename U>
  static Result<void> From(const Result<U>& other) {
    Result<void> r(other.Code());
    r.error_.message = other.Message();
    r.error_.suppressed = other.Suppressed();
    return r;
  }

  explicit operator bool() const noexcept { return ok_; }

  ErrorCode Code() const noexcept {
    return ok_ ? ErrorCode::kSuccess : error_.code;
  }

  const std::string& Message() const {
    static const std::string kEmpty;
    return ok_ ? kEmpty : error_.Message();
  }

  const std::vector<SuppressedError>& Suppressed() const {
    return error_.suppressed;
  }

  template <typename U>
  void Suppress(const Result<U>& other) {
    if (ok_ || other) return;
    SuppressedError e;
    e.code = other.Code();
    e.message = other.Message();
    error_.suppressed.push_back(e);
  }

 private:
  bool ok_ = false;
  detail::ErrorDetail error_{};
};

}  // namespace guardkit
