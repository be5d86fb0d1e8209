#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>
#include "stream_transport.hpp"

namespace fpssmb {

/**
 * @brief Memory-based transport implementation for testing and simple use cases
 *
 * Responses are scripted ahead of time (or completed by hand while a receive
 * is pending) and every sent frame is recorded. Useful for testing without a device.
 */
class MemoryTransport : public StreamTransport {
 public:
  MemoryTransport()
      : connect_states_{ConnectionState::kPreparing, ConnectionState::kReady} {}

  void Connect(const std::string &host, uint16_t port, StateHandler on_state) override {
    host_ = host;
    port_ = port;
    on_state_ = std::move(on_state);
    open_ = true;
    for (ConnectionState state : connect_states_) {
      EmitState(state);
    }
  }

  [[nodiscard]] bool Send(std::span<const uint8_t> data) override {
    if (!open_ || fail_sends_) {
      return false;
    }
    sent_frames_.emplace_back(data.begin(), data.end());
    return true;
  }

  void Receive(size_t min_length, size_t max_length, ReceiveHandler on_receive) override {
    last_min_length_ = min_length;
    last_max_length_ = max_length;
    ++receive_calls_;
    if (!open_) {
      on_receive(std::nullopt);
      return;
    }
    if (responses_.empty()) {
      pending_ = std::move(on_receive);
      return;
    }
    auto response = std::move(responses_.front());
    responses_.pop_front();
    Deliver(on_receive, std::move(response));
  }

  void Close() override {
    if (!open_) {
      return;
    }
    open_ = false;
    FailPendingReceive();
    EmitState(ConnectionState::kCancelled);
  }

  [[nodiscard]] bool IsOpen() const override { return open_; }

  // MemoryTransport-specific methods
  /**
   * @brief Queue bytes for the next Receive
   */
  void QueueResponse(std::span<const uint8_t> data) {
    responses_.emplace_back(std::vector<uint8_t>(data.begin(), data.end()));
  }

  /**
   * @brief Make the next Receive fail as if the stream broke
   */
  void QueueTransportError() { responses_.emplace_back(std::nullopt); }

  /**
   * @brief States reported by the next Connect (default: preparing, ready)
   */
  void SetConnectStates(std::vector<ConnectionState> states) { connect_states_ = std::move(states); }

  /**
   * @brief Report a state transition as the stream would
   */
  void EmitState(ConnectionState state) {
    if (on_state_) {
      on_state_(state);
    }
  }

  void SetSendFailure(bool fail) { fail_sends_ = fail; }

  [[nodiscard]] bool HasPendingReceive() const { return static_cast<bool>(pending_); }

  /**
   * @brief Complete a pending Receive with the given bytes
   */
  void CompletePendingReceive(std::span<const uint8_t> data) {
    if (auto handler = TakePending()) {
      Deliver(handler, std::vector<uint8_t>(data.begin(), data.end()));
    }
  }

  /**
   * @brief Complete a pending Receive with a transport error
   */
  void FailPendingReceive() {
    if (auto handler = TakePending()) {
      handler(std::nullopt);
    }
  }

  [[nodiscard]] const std::vector<std::vector<uint8_t>> &GetSentFrames() const { return sent_frames_; }
  [[nodiscard]] const std::string &GetHost() const { return host_; }
  [[nodiscard]] uint16_t GetPort() const { return port_; }
  [[nodiscard]] size_t GetReceiveCalls() const { return receive_calls_; }
  [[nodiscard]] size_t GetLastMinLength() const { return last_min_length_; }
  [[nodiscard]] size_t GetLastMaxLength() const { return last_max_length_; }

 private:
  ReceiveHandler TakePending() {
    ReceiveHandler handler = std::move(pending_);
    pending_ = nullptr;
    return handler;
  }

  // A stream read never returns more than max_length bytes
  void Deliver(const ReceiveHandler &handler, std::optional<std::vector<uint8_t>> data) {
    if (data.has_value() && data->size() > last_max_length_) {
      data->resize(last_max_length_);
    }
    handler(std::move(data));
  }

  std::string host_;
  uint16_t port_{0};
  StateHandler on_state_;
  bool open_{false};
  bool fail_sends_{false};
  std::vector<ConnectionState> connect_states_;
  std::deque<std::optional<std::vector<uint8_t>>> responses_;
  ReceiveHandler pending_;
  std::vector<std::vector<uint8_t>> sent_frames_;
  size_t receive_calls_{0};
  size_t last_min_length_{0};
  size_t last_max_length_{0};
};

}  // namespace fpssmb
