#include <cstdint>
#include <span>
#include <vector>
#include "client/frame_codec.hpp"
#include "rtu/rtu_frame.hpp"
#include "tcp/tcp_frame.hpp"

namespace fpssmb {

std::vector<uint8_t> FrameCodec::BuildReadRequest(uint8_t unit_id, uint16_t start_address, uint16_t count,
                                                  FramingMode mode) {
  switch (mode) {
    case FramingMode::kTcp:
      return TcpFrame::EncodeReadRequest(unit_id, start_address, count);
    case FramingMode::kRtuOverTcp:
      return RtuFrame::EncodeReadRequest(unit_id, start_address, count);
  }
  return {};
}

Result<std::vector<uint8_t>> FrameCodec::BuildWriteRequest(uint8_t unit_id, uint16_t start_address,
                                                           std::span<const uint16_t> values, FramingMode mode) {
  switch (mode) {
    case FramingMode::kTcp:
      return TcpFrame::EncodeWriteRequest(unit_id, start_address, values);
    case FramingMode::kRtuOverTcp:
      return RtuFrame::EncodeWriteRequest(unit_id, start_address, values);
  }
  return ErrorKind::kInvalidRequest;
}

Result<std::vector<uint16_t>> FrameCodec::DecodeReadResponse(std::span<const uint8_t> frame, FramingMode mode) {
  switch (mode) {
    case FramingMode::kTcp:
      return TcpFrame::DecodeReadResponse(frame);
    case FramingMode::kRtuOverTcp:
      return RtuFrame::DecodeReadResponse(frame);
  }
  return ErrorKind::kMalformed;
}

Result<void> FrameCodec::DecodeWriteResponse(std::span<const uint8_t> frame, FramingMode mode) {
  switch (mode) {
    case FramingMode::kTcp:
      return TcpFrame::DecodeWriteResponse(frame);
    case FramingMode::kRtuOverTcp:
      return RtuFrame::DecodeWriteResponse(frame);
  }
  return ErrorKind::kMalformed;
}

}  // namespace fpssmb
