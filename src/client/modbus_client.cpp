#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>
#include "client/frame_codec.hpp"
#include "client/modbus_client.hpp"
#include "common/log.hpp"

namespace fpssmb {

ModbusClient::ModbusClient(std::unique_ptr<StreamTransport> transport, ClientOptions options)
    : transport_(std::move(transport)),
      options_(options) {}

// The transport's destructor drops the connection without reporting
ModbusClient::~ModbusClient() = default;

void ModbusClient::Connect(const std::string &host, uint16_t port, StateHandler on_state) {
  if (!transport_) {
    FPSSMB_LOG_ERROR("connect to %s:%u without a transport", host.c_str(), static_cast<unsigned>(port));
    if (on_state) {
      on_state(ConnectionState::kFailed);
    }
    return;
  }

  FPSSMB_LOG_INFO("connecting to %s:%u (%s framing)", host.c_str(), static_cast<unsigned>(port),
                  ToString(options_.framing));
  transport_->Connect(host, port, [on_state = std::move(on_state)](ConnectionState state) {
    FPSSMB_LOG_INFO("connection state: %s", ToString(state));
    if (on_state) {
      on_state(state);
    }
  });
}

void ModbusClient::Close() {
  if (transport_) {
    transport_->Close();
  }
}

std::optional<ModbusError> ModbusClient::CheckCanStart() const {
  if (!IsConnected()) {
    FPSSMB_LOG_WARN("request on a closed connection");
    return ModbusError{ErrorKind::kTransport};
  }
  if (in_flight_) {
    FPSSMB_LOG_WARN("request while another exchange is outstanding");
    return ModbusError{ErrorKind::kBusy};
  }
  return {};
}

void ModbusClient::Exchange(const std::vector<uint8_t> &request, ResponseHandler on_response) {
  in_flight_ = true;

  if (!transport_->Send(request)) {
    FPSSMB_LOG_WARN("send of %zu byte request failed", request.size());
    in_flight_ = false;
    on_response(std::nullopt);
    return;
  }

  transport_->Receive(options_.min_response_size, options_.max_response_size,
                      [this, on_response = std::move(on_response)](std::optional<std::vector<uint8_t>> response) {
                        // Cleared first so the handler may start the next exchange
                        in_flight_ = false;
                        on_response(std::move(response));
                      });
}

void ModbusClient::ReadHoldingRegisters(uint8_t unit_id, uint16_t start_address, uint16_t count,
                                        ReadHandler on_result) {
  if (auto error = CheckCanStart()) {
    on_result(*error);
    return;
  }

  auto request = FrameCodec::BuildReadRequest(unit_id, start_address, count, options_.framing);
  FPSSMB_LOG_DEBUG("read unit %u address %u count %u", static_cast<unsigned>(unit_id),
                   static_cast<unsigned>(start_address), static_cast<unsigned>(count));

  Exchange(request, [framing = options_.framing,
                     on_result = std::move(on_result)](std::optional<std::vector<uint8_t>> response) {
    if (!response.has_value() || response->empty()) {
      FPSSMB_LOG_WARN("read failed: no response from transport");
      on_result(ModbusError{ErrorKind::kTransport});
      return;
    }
    on_result(FrameCodec::DecodeReadResponse(*response, framing));
  });
}

void ModbusClient::ReadHoldingRegisters(uint16_t start_address, uint16_t count, ReadHandler on_result) {
  ReadHoldingRegisters(options_.default_unit_id, start_address, count, std::move(on_result));
}

void ModbusClient::WriteHoldingRegisters(uint8_t unit_id, uint16_t start_address, std::span<const uint16_t> values,
                                         WriteHandler on_result) {
  if (auto error = CheckCanStart()) {
    on_result(*error);
    return;
  }

  auto request = FrameCodec::BuildWriteRequest(unit_id, start_address, values, options_.framing);
  if (!request.HasValue()) {
    on_result(request.Error());
    return;
  }
  FPSSMB_LOG_DEBUG("write unit %u address %u count %zu", static_cast<unsigned>(unit_id),
                   static_cast<unsigned>(start_address), values.size());

  Exchange(request.Value(), [framing = options_.framing,
                             on_result = std::move(on_result)](std::optional<std::vector<uint8_t>> response) {
    if (!response.has_value() || response->empty()) {
      FPSSMB_LOG_WARN("write failed: no response from transport");
      on_result(ModbusError{ErrorKind::kTransport});
      return;
    }
    on_result(FrameCodec::DecodeWriteResponse(*response, framing));
  });
}

void ModbusClient::WriteHoldingRegisters(uint16_t start_address, std::span<const uint16_t> values,
                                         WriteHandler on_result) {
  WriteHoldingRegisters(options_.default_unit_id, start_address, values, std::move(on_result));
}

}  // namespace fpssmb
