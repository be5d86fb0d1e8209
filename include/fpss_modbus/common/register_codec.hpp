#pragma once

#include <cstdint>
#include <span>
#include <vector>
#include "byte_helpers.hpp"

namespace fpssmb {

/**
 * @brief Unpack a data region into 16-bit registers (big-endian pairs, in order).
 *
 * A final unpaired byte is dropped. Response validation rejects odd regions
 * before they get here.
 */
[[nodiscard]] inline std::vector<uint16_t> DecodeRegisters(std::span<const uint8_t> data) {
  std::vector<uint16_t> registers;
  registers.reserve(data.size() / 2);
  for (size_t i = 0; i + 1 < data.size(); i += 2) {
    registers.push_back(MakeU16(data[i], data[i + 1]));
  }
  return registers;
}

/**
 * @brief Append registers to a frame as big-endian pairs.
 */
inline void AppendRegisters(std::vector<uint8_t> &out, std::span<const uint16_t> values) {
  for (uint16_t value : values) {
    PushU16(out, value);
  }
}

}  // namespace fpssmb
