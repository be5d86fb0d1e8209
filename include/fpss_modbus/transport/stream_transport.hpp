#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <vector>
#include "../common/connection_state.hpp"

namespace fpssmb {

/** Invoked once per connection state transition, in order. */
using StateHandler = std::function<void(ConnectionState)>;

/** Invoked exactly once per Receive call: the bytes read, or std::nullopt on transport error. */
using ReceiveHandler = std::function<void(std::optional<std::vector<uint8_t>>)>;

/**
 * @brief Abstract interface for a connected byte stream
 *
 * This interface allows the Modbus client to work with any stream
 * (TCP socket, memory buffer, etc.) without knowing the details.
 * Receive is completion based: the handler may run before Receive returns or later.
 */
class StreamTransport {
 public:
  /** Releases the connection silently: no StateHandler or ReceiveHandler runs. */
  virtual ~StreamTransport() = default;

  /**
   * @brief Open the connection
   * @param on_state Receives every state transition reported for this connection
   */
  virtual void Connect(const std::string &host, uint16_t port, StateHandler on_state) = 0;

  /**
   * @brief Send bytes; re-sending identical bytes must be harmless
   * @return true if all bytes were handed to the stream
   */
  [[nodiscard]] virtual bool Send(std::span<const uint8_t> data) = 0;

  /**
   * @brief Read one chunk of between min_length and max_length bytes
   */
  virtual void Receive(size_t min_length, size_t max_length, ReceiveHandler on_receive) = 0;

  /**
   * @brief Close the connection; a pending Receive completes with std::nullopt
   */
  virtual void Close() = 0;

  [[nodiscard]] virtual bool IsOpen() const = 0;
};

}  // namespace fpssmb
