#pragma once

#include <cstdint>
#include <exception>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace fleet {

/**
 * @brief Base exception for structural failures in the dispatch machinery
 */
class FleetException : public std::exception {
public:
  explicit FleetException(const std::string &message);
  const char *what() const noexcept override;

private:
  std::string message;
};

// Bucket-contract violation: unknown bucket name, or a handler that already
// ran being put back into the incomplete bucket.
class HandlerIncompatibleException : public FleetException {
public:
  using FleetException::FleetException;
};

// A registry descriptor names a handler nobody registered a constructor for.
class HandlerResolutionException : public FleetException {
public:
  using FleetException::FleetException;
};

// The dispatcher hit its execution bound with handlers still queued.
class DispatchLimitException : public FleetException {
public:
  using FleetException::FleetException;
};

// Domain failure raised by a handler. Captured by the dispatcher, never
// propagated past it.
class HandlerError : public FleetException {
public:
  using FleetException::FleetException;
};

[[noreturn]] void throwError(const std::string &message);

// Value-level error code carried by Result<T>
enum class ErrorCode : uint16_t {
  Ok = 0,
  InvalidArgument,
  InvalidState,
  NotFound,
  AlreadyExists,
  ParseError,
  LimitExceeded,
  Internal
};

std::string_view errorCodeToString(ErrorCode code);

// Result type combining value + error. Move-only.
template <typename T>
class Result {
public:
  static Result ok(T value) { return Result(std::move(value)); }

  static Result error(ErrorCode code, std::string message = "") {
    return Result(code, std::move(message));
  }

  bool isOk() const { return code_ == ErrorCode::Ok; }
  bool isError() const { return code_ != ErrorCode::Ok; }
  ErrorCode code() const { return code_; }
  const std::string &message() const { return message_; }

  T &value() {
    if (isError())
      throwError("Result contains error: " + message_);
    return *value_;
  }

  const T &value() const {
    if (isError())
      throwError("Result contains error: " + message_);
    return *value_;
  }

  T valueOr(T defaultValue) const {
    if (isOk())
      return *value_;
    return defaultValue;
  }

  Result(Result &&) = default;
  Result &operator=(Result &&) = default;
  Result(const Result &) = delete;
  Result &operator=(const Result &) = delete;

private:
  explicit Result(T value)
      : code_(ErrorCode::Ok), value_(std::move(value)) {}

  Result(ErrorCode code, std::string message)
      : code_(code), message_(std::move(message)) {}

  ErrorCode code_;
  std::string message_;
  std::optional<T> value_;
};

template <>
class Result<void> {
public:
  static Result ok() { return Result(); }

  static Result error(ErrorCode code, std::string message = "") {
    return Result(code, std::move(message));
  }

  bool isOk() const { return code_ == ErrorCode::Ok; }
  bool isError() const { return code_ != ErrorCode::Ok; }
  ErrorCode code() const { return code_; }
  const std::string &message() const { return message_; }

  Result(Result &&) = default;
  Result &operator=(Result &&) = default;
  Result(const Result &) = delete;
  Result &operator=(const Result &) = delete;

private:
  Result() : code_(ErrorCode::Ok) {}

  Result(ErrorCode code, std::string message)
      : code_(code), message_(std::move(message)) {}

  ErrorCode code_;
  std::string message_;
};

} // namespace fleet
