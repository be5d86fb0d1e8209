#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include "byte_helpers.hpp"

namespace fpssmb {

static constexpr size_t kCrcSize = 2;

static constexpr uint16_t kCrcInitialValue = 0xFFFF;
static constexpr uint16_t kCrcPolynomial = 0xA001;  // 0x8005 bit-reversed

/**
 * @brief Modbus CRC-16 over data, processed least significant bit first
 * @return Checksum value; SealBody/ReadFrameCrc put it on the wire low byte first
 */
[[nodiscard]] inline uint16_t CalculateCrc16(std::span<uint8_t const> data) {
  uint16_t crc = kCrcInitialValue;
  for (uint8_t byte : data) {
    crc ^= byte;
    for (uint8_t bit = 0; bit < kBitsPerByte; ++bit) {
      const bool lsb_set = (crc & 1U) != 0;
      crc >>= 1;
      if (lsb_set) {
        crc ^= kCrcPolynomial;
      }
    }
  }
  return crc;
}

/**
 * @brief Read the trailing CRC of a frame (low byte first)
 * @param frame Frame of at least kCrcSize bytes
 */
[[nodiscard]] inline uint16_t ReadFrameCrc(std::span<uint8_t const> frame) {
  return MakeU16(frame[frame.size() - 1], frame[frame.size() - 2]);
}

/**
 * @brief Check the trailing CRC of a frame against its preceding bytes
 * @return false for frames shorter than kCrcSize
 */
[[nodiscard]] inline bool VerifyCrc16(std::span<uint8_t const> frame) {
  if (frame.size() < kCrcSize) {
    return false;
  }

  return CalculateCrc16(frame.first(frame.size() - kCrcSize)) == ReadFrameCrc(frame);
}

}  // namespace fpssmb
