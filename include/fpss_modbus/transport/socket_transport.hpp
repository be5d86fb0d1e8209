/**
 * @file socket_transport.hpp
 * @brief POSIX TCP client socket transport
 *
 * Provides StreamTransport over a TCP connection opened with connect(2).
 * Connect and Receive block the calling thread; handlers run on that thread.
 * Close may be called from another thread to abort a blocked Send or Receive:
 * it shuts the socket down at once, and the descriptor itself is closed when
 * the last Send or Receive using it returns. Connect must not overlap a Send
 * or Receive.
 *
 * Usage:
 *   auto transport = std::make_unique<SocketTransport>();
 *   ModbusClient client(std::move(transport), {.framing = FramingMode::kTcp});
 *   client.Connect("192.168.1.10", 502, on_state);
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <vector>
#include "stream_transport.hpp"

namespace fpssmb {

struct SocketTransportOptions {
  /** Upper bound for one Receive; 0 waits indefinitely */
  uint32_t receive_timeout_ms{0};
};

class SocketTransport : public StreamTransport {
 public:
  explicit SocketTransport(SocketTransportOptions options = {})
      : options_(options) {}

  ~SocketTransport() override;

  SocketTransport(const SocketTransport &) = delete;
  SocketTransport &operator=(const SocketTransport &) = delete;

  /**
   * @brief Resolve host and connect; reports preparing, then ready or failed
   *
   * A connection that is still open is dropped first, without reporting.
   */
  void Connect(const std::string &host, uint16_t port, StateHandler on_state) override;

  [[nodiscard]] bool Send(std::span<const uint8_t> data) override;

  /**
   * @brief Block until at least min_length bytes (at most max_length) arrived, the peer closed, or the timeout hit
   */
  void Receive(size_t min_length, size_t max_length, ReceiveHandler on_receive) override;

  /**
   * @brief Shut the socket down and report cancelled
   */
  void Close() override;

  [[nodiscard]] bool IsOpen() const override;

 private:
  /**
   * @brief Keeps the descriptor from being closed while a Send or Receive uses it
   */
  class FdLease {
   public:
    explicit FdLease(SocketTransport &owner)
        : owner_(owner),
          fd_(owner.AcquireFd()) {}
    ~FdLease() {
      if (fd_ >= 0) {
        owner_.ReleaseFd();
      }
    }

    FdLease(const FdLease &) = delete;
    FdLease &operator=(const FdLease &) = delete;

    [[nodiscard]] int Get() const { return fd_; }

   private:
    SocketTransport &owner_;
    int fd_;
  };

  /** Descriptor of the open connection, or -1; counts one more user */
  int AcquireFd();
  void ReleaseFd();
  void CloseFdLocked();

  std::optional<std::vector<uint8_t>> ReadChunk(size_t min_length, size_t max_length);
  void Report(ConnectionState state);

  SocketTransportOptions options_;
  mutable std::mutex mutex_;
  int fd_{-1};
  bool open_{false};
  int users_{0};
  StateHandler on_state_;
};

}  // namespace fpssmb
