#pragma once

#include <cstdint>
#include <span>
#include <vector>
#include "../common/error.hpp"
#include "../common/framing_mode.hpp"

namespace fpssmb {

/**
 * @brief Frame codec parameterized by framing mode
 *
 * Dispatches to TcpFrame or RtuFrame so callers only carry a FramingMode.
 */
class FrameCodec {
 public:
  [[nodiscard]] static std::vector<uint8_t> BuildReadRequest(uint8_t unit_id, uint16_t start_address, uint16_t count,
                                                             FramingMode mode);

  [[nodiscard]] static Result<std::vector<uint8_t>> BuildWriteRequest(uint8_t unit_id, uint16_t start_address,
                                                                      std::span<const uint16_t> values,
                                                                      FramingMode mode);

  [[nodiscard]] static Result<std::vector<uint16_t>> DecodeReadResponse(std::span<const uint8_t> frame,
                                                                        FramingMode mode);

  [[nodiscard]] static Result<void> DecodeWriteResponse(std::span<const uint8_t> frame, FramingMode mode);
};

}  // namespace fpssmb
