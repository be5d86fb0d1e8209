#include <cstdint>
#include <span>
#include <vector>
#include "common/byte_helpers.hpp"
#include "common/function_code.hpp"
#include "common/log.hpp"
#include "common/register_codec.hpp"
#include "common/request_body.hpp"
#include "tcp/tcp_frame.hpp"

namespace fpssmb {

std::vector<uint8_t> TcpFrame::WrapBody(std::span<const uint8_t> body) {
  const auto length = static_cast<uint16_t>(body.size());

  std::vector<uint8_t> frame;
  frame.reserve(kMbapPrefixSize + body.size());
  PushU16(frame, kTransactionId);
  PushU16(frame, kProtocolId);
  PushU16(frame, length);
  frame.insert(frame.end(), body.begin(), body.end());
  return frame;
}

std::vector<uint8_t> TcpFrame::EncodeReadRequest(uint8_t unit_id, uint16_t start_address, uint16_t count) {
  return WrapBody(RequestBody::ReadHoldingRegisters(unit_id, start_address, count));
}

Result<std::vector<uint8_t>> TcpFrame::EncodeWriteRequest(uint8_t unit_id, uint16_t start_address,
                                                          std::span<const uint16_t> values) {
  auto body = RequestBody::WriteMultipleRegisters(unit_id, start_address, values);
  if (!body.HasValue()) {
    return body.Error();
  }
  return WrapBody(body.Value());
}

Result<std::vector<uint16_t>> TcpFrame::DecodeReadResponse(std::span<const uint8_t> frame) {
  if (frame.size() < kMinReadResponseSize) {
    FPSSMB_LOG_WARN("tcp read response too short: %zu bytes", frame.size());
    return ErrorKind::kMalformed;
  }

  const size_t byte_count = frame[kByteCountOffset];
  const bool data_fits = frame.size() >= kReadDataOffset + byte_count && byte_count % 2 == 0;

  // Exception PDU: function code | 0x80, exception code where the byte count would be.
  // Only names the failure; a frame that passes the data checks is decoded as before.
  if (!data_fits && IsExceptionFunctionCode(frame[kFunctionCodeOffset])) {
    FPSSMB_LOG_WARN("tcp exception response, code 0x%02X", frame[kByteCountOffset]);
    return MakeExceptionError(frame[kByteCountOffset]);
  }

  if (frame.size() < kReadDataOffset + byte_count) {
    FPSSMB_LOG_WARN("tcp read response truncated: byte count %zu, frame %zu bytes", byte_count, frame.size());
    return ErrorKind::kMalformed;
  }
  if (byte_count % 2 != 0) {
    FPSSMB_LOG_WARN("tcp read response has odd data byte count %zu", byte_count);
    return ErrorKind::kMalformed;
  }

  auto registers = DecodeRegisters(frame.subspan(kReadDataOffset, byte_count));
  FPSSMB_LOG_DEBUG("tcp read response decoded %zu registers", registers.size());
  return registers;
}

Result<void> TcpFrame::DecodeWriteResponse(std::span<const uint8_t> frame) {
  if (frame.size() > kByteCountOffset && IsExceptionFunctionCode(frame[kFunctionCodeOffset])) {
    FPSSMB_LOG_WARN("tcp exception response, code 0x%02X", frame[kByteCountOffset]);
    return MakeExceptionError(frame[kByteCountOffset]);
  }
  if (frame.size() < kWriteResponseSize) {
    FPSSMB_LOG_WARN("tcp write response too short: %zu bytes", frame.size());
    return ErrorKind::kMalformed;
  }
  if (frame[kFunctionCodeOffset] != static_cast<uint8_t>(FunctionCode::kWriteMultRegs)) {
    FPSSMB_LOG_WARN("tcp write response echoes function 0x%02X", frame[kFunctionCodeOffset]);
    return ErrorKind::kAckMismatch;
  }
  return {};
}

}  // namespace fpssmb
