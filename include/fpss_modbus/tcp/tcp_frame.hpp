#pragma once

#include <cstdint>
#include <span>
#include <vector>
#include "../common/error.hpp"

namespace fpssmb {

/**
 * @brief Modbus TCP frame encoder/validator
 *
 * Modbus TCP uses the MBAP (Modbus Application Protocol) header:
 * - Transaction ID (2 bytes, always 0x0000 here: one exchange at a time)
 * - Protocol ID (2 bytes, always 0x0000)
 * - Length (2 bytes) - number of bytes following (Unit ID + PDU)
 * - Unit ID (1 byte)
 * - PDU (Protocol Data Unit) - function code + data
 */
class TcpFrame {
 public:
  /**
   * @brief Encode a read holding registers request
   * @return 12-byte frame, length field 6
   */
  [[nodiscard]] static std::vector<uint8_t> EncodeReadRequest(uint8_t unit_id, uint16_t start_address, uint16_t count);

  /**
   * @brief Encode a write multiple registers request
   * @return Complete frame, or kInvalidRequest if there are too many values
   */
  [[nodiscard]] static Result<std::vector<uint8_t>> EncodeWriteRequest(uint8_t unit_id, uint16_t start_address,
                                                                       std::span<const uint16_t> values);

  /**
   * @brief Validate a read holding registers response and extract its registers
   * @param frame Untrusted bytes received from the transport
   * @return Registers in ascending address order, or kMalformed / kExceptionResponse
   */
  [[nodiscard]] static Result<std::vector<uint16_t>> DecodeReadResponse(std::span<const uint8_t> frame);

  /**
   * @brief Check a write multiple registers acknowledgement
   *
   * Succeeds iff the frame has at least 12 bytes and echoes function code 0x10.
   */
  [[nodiscard]] static Result<void> DecodeWriteResponse(std::span<const uint8_t> frame);

  /**
   * @brief Prefix a request body (unit id onward) with the MBAP header
   *
   * The length field is derived from the finished body before the frame is built.
   */
  [[nodiscard]] static std::vector<uint8_t> WrapBody(std::span<const uint8_t> body);

 private:
  static constexpr size_t kMbapPrefixSize = 6;     // Transaction ID(2) + Protocol ID(2) + Length(2)
  static constexpr size_t kFunctionCodeOffset = 7;
  static constexpr size_t kByteCountOffset = 8;
  static constexpr size_t kReadDataOffset = 9;     // MBAP prefix + Unit ID + function code + byte count
  static constexpr size_t kMinReadResponseSize = 9;
  static constexpr size_t kWriteResponseSize = 12;  // MBAP prefix + Unit ID + function code + address(2) + count(2)
  static constexpr uint16_t kTransactionId = 0x0000;
  static constexpr uint16_t kProtocolId = 0x0000;
};

}  // namespace fpssmb
