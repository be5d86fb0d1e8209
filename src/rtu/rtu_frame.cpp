#include <cstdint>
#include <span>
#include <utility>
#include <vector>
#include "common/byte_helpers.hpp"
#include "common/crc16.hpp"
#include "common/function_code.hpp"
#include "common/log.hpp"
#include "common/register_codec.hpp"
#include "common/request_body.hpp"
#include "rtu/rtu_frame.hpp"

namespace fpssmb {

std::vector<uint8_t> RtuFrame::SealBody(std::vector<uint8_t> body) {
  // Little-endian on the wire: low byte first
  uint16_t crc = CalculateCrc16(body);
  body.push_back(GetLowByte(crc));
  body.push_back(GetHighByte(crc));
  return body;
}

std::vector<uint8_t> RtuFrame::EncodeReadRequest(uint8_t unit_id, uint16_t start_address, uint16_t count) {
  return SealBody(RequestBody::ReadHoldingRegisters(unit_id, start_address, count));
}

Result<std::vector<uint8_t>> RtuFrame::EncodeWriteRequest(uint8_t unit_id, uint16_t start_address,
                                                          std::span<const uint16_t> values) {
  auto body = RequestBody::WriteMultipleRegisters(unit_id, start_address, values);
  if (!body.HasValue()) {
    return body.Error();
  }
  return SealBody(std::move(body).Value());
}

Result<std::vector<uint16_t>> RtuFrame::DecodeReadResponse(std::span<const uint8_t> frame) {
  if (frame.size() < kMinResponseSize) {
    FPSSMB_LOG_WARN("rtu read response too short: %zu bytes", frame.size());
    return ErrorKind::kMalformed;
  }

  if (!VerifyCrc16(frame)) {
    FPSSMB_LOG_WARN("rtu read response CRC mismatch: received 0x%04X, calculated 0x%04X", ReadFrameCrc(frame),
                    CalculateCrc16(frame.first(frame.size() - kCrcSize)));
    return ErrorKind::kCrcMismatch;
  }

  if (IsExceptionFunctionCode(frame[kFunctionCodeOffset])) {
    FPSSMB_LOG_WARN("rtu exception response, code 0x%02X", frame[kExceptionCodeOffset]);
    return MakeExceptionError(frame[kExceptionCodeOffset]);
  }

  const size_t byte_count = frame[kByteCountOffset];
  if (frame.size() < kReadDataOffset + byte_count + kCrcSize) {
    FPSSMB_LOG_WARN("rtu read response truncated: byte count %zu, frame %zu bytes", byte_count, frame.size());
    return ErrorKind::kMalformed;
  }
  if (byte_count % 2 != 0) {
    FPSSMB_LOG_WARN("rtu read response has odd data byte count %zu", byte_count);
    return ErrorKind::kMalformed;
  }

  auto registers = DecodeRegisters(frame.subspan(kReadDataOffset, byte_count));
  FPSSMB_LOG_DEBUG("rtu read response decoded %zu registers", registers.size());
  return registers;
}

Result<void> RtuFrame::DecodeWriteResponse(std::span<const uint8_t> frame) {
  if (frame.size() < kWriteResponseSize) {
    // A short frame can still be a well-formed exception reply
    if (frame.size() >= kMinResponseSize && VerifyCrc16(frame) && IsExceptionFunctionCode(frame[kFunctionCodeOffset])) {
      FPSSMB_LOG_WARN("rtu exception response, code 0x%02X", frame[kExceptionCodeOffset]);
      return MakeExceptionError(frame[kExceptionCodeOffset]);
    }
    FPSSMB_LOG_WARN("rtu write response too short: %zu bytes", frame.size());
    return ErrorKind::kMalformed;
  }
  if (!VerifyCrc16(frame)) {
    FPSSMB_LOG_WARN("rtu write response CRC mismatch");
    return ErrorKind::kCrcMismatch;
  }
  return {};
}

}  // namespace fpssmb
