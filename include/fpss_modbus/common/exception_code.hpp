#pragma once

#include <cstdint>

namespace fpssmb {

/**
 * @brief Code carried in the byte after an exception function code (fc | 0x80)
 *
 * kNone marks a ModbusError that is not a device exception. Codes outside
 * this list are passed through unchanged and print as UNKNOWN.
 */
enum class ExceptionCode : uint8_t {
  kNone = 0x00,
  kIllegalFunction = 0x01,
  kIllegalDataAddress = 0x02,
  kIllegalDataValue = 0x03,
  kServerDeviceFailure = 0x04,
  kAcknowledge = 0x05,
  kServerDeviceBusy = 0x06,
  kMemoryParityError = 0x08,
  kGatewayPathUnavailable = 0x0A,
  kGatewayTargetFailed = 0x0B,
};

[[nodiscard]] inline const char *ExceptionCodeToString(ExceptionCode code) {
  switch (code) {
    case ExceptionCode::kIllegalFunction:
      return "ILLEGAL_FUNCTION";
    case ExceptionCode::kIllegalDataAddress:
      return "ILLEGAL_DATA_ADDRESS";
    case ExceptionCode::kIllegalDataValue:
      return "ILLEGAL_DATA_VALUE";
    case ExceptionCode::kServerDeviceFailure:
      return "SERVER_DEVICE_FAILURE";
    case ExceptionCode::kAcknowledge:
      return "ACKNOWLEDGE";
    case ExceptionCode::kServerDeviceBusy:
      return "SERVER_DEVICE_BUSY";
    case ExceptionCode::kMemoryParityError:
      return "MEMORY_PARITY_ERROR";
    case ExceptionCode::kGatewayPathUnavailable:
      return "GATEWAY_PATH_UNAVAILABLE";
    case ExceptionCode::kGatewayTargetFailed:
      return "GATEWAY_TARGET_FAILED";
    default:
      return "UNKNOWN";
  }
}

}  // namespace fpssmb
