#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "../common/client_options.hpp"
#include "../common/connection_state.hpp"
#include "../common/error.hpp"
#include "../transport/stream_transport.hpp"

namespace fpssmb {

using ReadResult = Result<std::vector<uint16_t>>;
using WriteResult = Result<void>;
using ReadHandler = std::function<void(ReadResult)>;
using WriteHandler = std::function<void(WriteResult)>;

/**
 * @brief Modbus client for one device connection
 *
 * Each operation builds a request, sends it, issues exactly one bounded
 * receive, validates the reply and invokes its handler exactly once.
 * At most one exchange is outstanding at a time; an operation started
 * while another is pending fails immediately with ErrorKind::kBusy.
 * Not thread-safe: the caller serializes operations.
 */
class ModbusClient {
 public:
  /**
   * @brief Construct a Modbus client
   * @param transport Stream used for this connection (ownership taken)
   * @param options Framing mode, default unit id and receive bounds; fixed for the client's lifetime
   */
  explicit ModbusClient(std::unique_ptr<StreamTransport> transport, ClientOptions options = {});

  /**
   * @brief Release the connection; no state or result handler is invoked
   */
  ~ModbusClient();

  ModbusClient(const ModbusClient &) = delete;
  ModbusClient &operator=(const ModbusClient &) = delete;

  /**
   * @brief Open the connection
   * @param on_state Receives every transition the transport reports, verbatim and in order
   */
  void Connect(const std::string &host, uint16_t port, StateHandler on_state);

  /**
   * @brief Close the connection; a pending exchange fails with kTransport
   */
  void Close();

  /**
   * @brief Read holding registers (FC 3)
   * @param on_result Registers in ascending address order, or the reason the exchange failed
   */
  void ReadHoldingRegisters(uint8_t unit_id, uint16_t start_address, uint16_t count, ReadHandler on_result);

  /**
   * @brief Read holding registers from the configured default unit
   */
  void ReadHoldingRegisters(uint16_t start_address, uint16_t count, ReadHandler on_result);

  /**
   * @brief Write multiple holding registers (FC 16, whatever the number of values)
   * @param on_result Success, or the reason the exchange failed
   */
  void WriteHoldingRegisters(uint8_t unit_id, uint16_t start_address, std::span<const uint16_t> values,
                             WriteHandler on_result);

  /**
   * @brief Write holding registers on the configured default unit
   */
  void WriteHoldingRegisters(uint16_t start_address, std::span<const uint16_t> values, WriteHandler on_result);

  [[nodiscard]] bool IsBusy() const { return in_flight_; }
  [[nodiscard]] bool IsConnected() const { return transport_ && transport_->IsOpen(); }
  [[nodiscard]] const ClientOptions &GetOptions() const { return options_; }

 private:
  using ResponseHandler = std::function<void(std::optional<std::vector<uint8_t>>)>;

  /**
   * @brief Reason an exchange cannot start now, if any
   */
  [[nodiscard]] std::optional<ModbusError> CheckCanStart() const;

  /**
   * @brief Send a request and hand the single received chunk to on_response
   */
  void Exchange(const std::vector<uint8_t> &request, ResponseHandler on_response);

  std::unique_ptr<StreamTransport> transport_;
  const ClientOptions options_;
  bool in_flight_{false};
};

}  // namespace fpssmb
