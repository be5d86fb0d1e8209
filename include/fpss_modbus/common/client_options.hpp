#pragma once

#include <cstddef>
#include <cstdint>
#include "framing_mode.hpp"

namespace fpssmb {

static constexpr uint8_t kDefaultUnitId = 1;

/**
 * @brief Per-connection client configuration. Fixed once the client is constructed.
 */
struct ClientOptions {
  FramingMode framing{FramingMode::kTcp};
  /** Unit id used by the overloads that take none */
  uint8_t default_unit_id{kDefaultUnitId};
  /** Bounds of the single receive issued per exchange */
  size_t min_response_size{1};
  /**
   * Fixed receive ceiling of 256 bytes. TCP reads of more than 123 registers
   * (9 + 2*count > 256) arrive truncated and fail as kMalformed.
   */
  size_t max_response_size{256};
};

}  // namespace fpssmb
