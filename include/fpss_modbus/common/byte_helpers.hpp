#pragma once

#include <cstdint>
#include <vector>

namespace fpssmb {

static constexpr uint8_t kMaxByte = 0xFF;
static constexpr uint8_t kBitsPerByte = 8;

static inline constexpr uint8_t GetLowByte(uint16_t value) {
  return value & kMaxByte;
}

static inline constexpr uint8_t GetHighByte(uint16_t value) {
  return (value >> kBitsPerByte) & kMaxByte;
}

// Wire order is the caller's business: pass the bytes as high, low.
static inline constexpr uint16_t MakeU16(uint8_t high_byte, uint8_t low_byte) {
  return static_cast<uint16_t>(static_cast<uint16_t>(high_byte) << kBitsPerByte | static_cast<uint16_t>(low_byte));
}

/**
 * @brief Append a 16-bit field in Modbus (big-endian) order
 */
static inline void PushU16(std::vector<uint8_t> &out, uint16_t value) {
  out.push_back(GetHighByte(value));
  out.push_back(GetLowByte(value));
}

}  // namespace fpssmb
