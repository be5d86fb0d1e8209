#pragma once

#include <cstdint>
#include <span>
#include <vector>
#include "../common/error.hpp"

namespace fpssmb {

/**
 * @brief RTU frame encoder/validator for RTU framing carried over a TCP stream
 *
 * Frame layout: unit id, function code, data, CRC-16 (low byte first).
 * Includes CRC calculation and verification.
 */
class RtuFrame {
 public:
  /**
   * @brief Encode a read holding registers request
   * @return 8-byte frame, CRC over the first 6 bytes
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
   *
   * Checks are applied in order: minimum size, CRC, exception flag, byte count bounds and parity.
   * @param frame Untrusted bytes received from the transport
   */
  [[nodiscard]] static Result<std::vector<uint16_t>> DecodeReadResponse(std::span<const uint8_t> frame);

  /**
   * @brief Check a write multiple registers acknowledgement
   *
   * Succeeds iff the frame has at least 8 bytes and a valid CRC. The echoed
   * unit id, function code and address are not compared.
   */
  [[nodiscard]] static Result<void> DecodeWriteResponse(std::span<const uint8_t> frame);

  /**
   * @brief Append the CRC of a request body (unit id onward)
   */
  [[nodiscard]] static std::vector<uint8_t> SealBody(std::vector<uint8_t> body);

 private:
  static constexpr size_t kFunctionCodeOffset = 1;
  static constexpr size_t kByteCountOffset = 2;
  static constexpr size_t kExceptionCodeOffset = 2;
  static constexpr size_t kReadDataOffset = 3;  // unit id + function code + byte count
  static constexpr size_t kMinResponseSize = 5;  // unit id + function code + byte/exception code + CRC
  static constexpr size_t kWriteResponseSize = 8;  // unit id + function code + address(2) + count(2) + CRC
};

}  // namespace fpssmb
