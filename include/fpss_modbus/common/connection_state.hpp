#pragma once

#include <cstdint>
#include <string_view>

namespace fpssmb {

/**
 * @brief Connection states reported by a transport.
 *
 * kUnknown stands for any transport signal outside the recognized set.
 */
enum class ConnectionState : uint8_t {
  kPreparing,
  kReady,
  kWaiting,
  kFailed,
  kCancelled,
  kUnknown
};

[[nodiscard]] inline const char *ToString(ConnectionState state) {
  switch (state) {
    case ConnectionState::kPreparing:
      return "preparing";
    case ConnectionState::kReady:
      return "ready";
    case ConnectionState::kWaiting:
      return "waiting";
    case ConnectionState::kFailed:
      return "failed";
    case ConnectionState::kCancelled:
      return "cancelled";
    default:
      return "unknown";
  }
}

/**
 * @brief Map a state name back to a ConnectionState
 * @return kUnknown for anything not in the recognized set
 */
[[nodiscard]] inline ConnectionState ParseConnectionState(std::string_view name) {
  if (name == "preparing") {
    return ConnectionState::kPreparing;
  }
  if (name == "ready") {
    return ConnectionState::kReady;
  }
  if (name == "waiting") {
    return ConnectionState::kWaiting;
  }
  if (name == "failed") {
    return ConnectionState::kFailed;
  }
  if (name == "cancelled") {
    return ConnectionState::kCancelled;
  }
  return ConnectionState::kUnknown;
}

}  // namespace fpssmb
