#pragma once

#include <cstdint>
#include <optional>
#include <utility>
#include <variant>
#include "exception_code.hpp"

namespace fpssmb {

/**
 * @brief Why a single exchange failed.
 *
 * None of these is fatal: the client stays usable for the next exchange.
 */
enum class ErrorKind : uint8_t {
  /** Connect, send or receive failed, the response was empty, or the client is not connected */
  kTransport,
  /** A length or parity bound of the response was violated */
  kMalformed,
  /** RTU-over-TCP response checksum does not match its contents */
  kCrcMismatch,
  /** The device answered with a Modbus exception (see ModbusError::exception_code) */
  kExceptionResponse,
  /** A write acknowledgement did not echo the write function code */
  kAckMismatch,
  /** The request cannot be encoded (e.g. too many registers for one write) */
  kInvalidRequest,
  /** Another exchange is still outstanding on this client */
  kBusy
};

[[nodiscard]] inline const char *ToString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kTransport:
      return "transport";
    case ErrorKind::kMalformed:
      return "malformed";
    case ErrorKind::kCrcMismatch:
      return "crc-mismatch";
    case ErrorKind::kExceptionResponse:
      return "exception-response";
    case ErrorKind::kAckMismatch:
      return "ack-mismatch";
    case ErrorKind::kInvalidRequest:
      return "invalid-request";
    case ErrorKind::kBusy:
      return "busy";
  }
  return "unknown";
}

struct ModbusError {
  ErrorKind kind{ErrorKind::kTransport};
  /** Only meaningful for kExceptionResponse */
  ExceptionCode exception_code{ExceptionCode::kNone};

  bool operator==(const ModbusError &) const = default;
};

/**
 * @brief Outcome of one exchange: either a value or a ModbusError.
 */
template <typename T>
class Result {
 public:
  Result(T value)  // NOLINT(google-explicit-constructor)
      : storage_(std::move(value)) {}
  Result(ModbusError error)  // NOLINT(google-explicit-constructor)
      : storage_(error) {}
  Result(ErrorKind kind)  // NOLINT(google-explicit-constructor)
      : storage_(ModbusError{kind}) {}

  [[nodiscard]] bool HasValue() const { return std::holds_alternative<T>(storage_); }
  explicit operator bool() const { return HasValue(); }

  [[nodiscard]] const T &Value() const & { return std::get<T>(storage_); }
  [[nodiscard]] T &Value() & { return std::get<T>(storage_); }
  [[nodiscard]] T &&Value() && { return std::get<T>(std::move(storage_)); }

  const T &operator*() const & { return Value(); }
  const T *operator->() const { return &Value(); }

  [[nodiscard]] const ModbusError &Error() const { return std::get<ModbusError>(storage_); }

 private:
  std::variant<T, ModbusError> storage_;
};

/**
 * @brief Outcome of an exchange that carries no value (write acknowledgement).
 */
template <>
class Result<void> {
 public:
  Result() = default;
  Result(ModbusError error)  // NOLINT(google-explicit-constructor)
      : error_(error) {}
  Result(ErrorKind kind)  // NOLINT(google-explicit-constructor)
      : error_(ModbusError{kind}) {}

  [[nodiscard]] bool HasValue() const { return !error_.has_value(); }
  explicit operator bool() const { return HasValue(); }

  [[nodiscard]] const ModbusError &Error() const { return error_.value(); }

 private:
  std::optional<ModbusError> error_{};
};

[[nodiscard]] inline ModbusError MakeExceptionError(uint8_t exception_code) {
  return ModbusError{ErrorKind::kExceptionResponse, static_cast<ExceptionCode>(exception_code)};
}

}  // namespace fpssmb
