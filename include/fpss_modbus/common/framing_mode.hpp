#pragma once

#include <cstdint>

namespace fpssmb {

/**
 * @brief Wire framing used by a client for its whole lifetime.
 */
enum class FramingMode : uint8_t {
  /** MBAP header (transaction id, protocol id, length), no checksum */
  kTcp,
  /** RTU frame (unit id, PDU, CRC-16) carried over a TCP stream */
  kRtuOverTcp
};

[[nodiscard]] inline const char *ToString(FramingMode mode) {
  return mode == FramingMode::kTcp ? "tcp" : "rtu-over-tcp";
}

}  // namespace fpssmb
