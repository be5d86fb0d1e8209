#pragma once

#include <cstdint>
#include <span>
#include <vector>
#include "error.hpp"

namespace fpssmb {

/** Largest write whose byte count still fits the single byte-count field. */
static constexpr size_t kMaxWriteRegisters = 127;

/**
 * @brief Request body shared by both framings: unit id, function code, function data.
 *
 * TCP framing prefixes it with the MBAP header, RTU-over-TCP framing appends the CRC.
 */
class RequestBody {
 public:
  /**
   * @brief Read holding registers (FC 3) body
   * @return [unit, 0x03, addrHi, addrLo, countHi, countLo]
   */
  [[nodiscard]] static std::vector<uint8_t> ReadHoldingRegisters(uint8_t unit_id, uint16_t start_address,
                                                                 uint16_t count);

  /**
   * @brief Write multiple registers (FC 16) body, used for any number of values
   * @return [unit, 0x10, addrHi, addrLo, countHi, countLo, byteCount, values...], or kInvalidRequest when
   * values exceeds kMaxWriteRegisters
   */
  [[nodiscard]] static Result<std::vector<uint8_t>> WriteMultipleRegisters(uint8_t unit_id, uint16_t start_address,
                                                                           std::span<const uint16_t> values);
};

}  // namespace fpssmb
