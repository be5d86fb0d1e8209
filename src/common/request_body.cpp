#include <cstdint>
#include <span>
#include <vector>
#include "common/byte_helpers.hpp"
#include "common/function_code.hpp"
#include "common/log.hpp"
#include "common/register_codec.hpp"
#include "common/request_body.hpp"

namespace fpssmb {

namespace {

constexpr size_t kReadBodySize = 6;       // unit + function + address(2) + count(2)
constexpr size_t kWriteHeaderSize = 7;    // unit + function + address(2) + count(2) + byte_count

void AppendAddressAndCount(std::vector<uint8_t> &body, uint16_t start_address, uint16_t count) {
  PushU16(body, start_address);
  PushU16(body, count);
}

}  // namespace

std::vector<uint8_t> RequestBody::ReadHoldingRegisters(uint8_t unit_id, uint16_t start_address, uint16_t count) {
  std::vector<uint8_t> body;
  body.reserve(kReadBodySize);
  body.push_back(unit_id);
  body.push_back(static_cast<uint8_t>(FunctionCode::kReadHR));
  AppendAddressAndCount(body, start_address, count);
  return body;
}

Result<std::vector<uint8_t>> RequestBody::WriteMultipleRegisters(uint8_t unit_id, uint16_t start_address,
                                                                 std::span<const uint16_t> values) {
  if (values.size() > kMaxWriteRegisters) {
    FPSSMB_LOG_WARN("write of %zu registers exceeds the %zu register limit", values.size(), kMaxWriteRegisters);
    return ErrorKind::kInvalidRequest;
  }

  const auto reg_count = static_cast<uint16_t>(values.size());
  std::vector<uint8_t> body;
  body.reserve(kWriteHeaderSize + values.size() * 2);
  body.push_back(unit_id);
  body.push_back(static_cast<uint8_t>(FunctionCode::kWriteMultRegs));
  AppendAddressAndCount(body, start_address, reg_count);
  body.push_back(static_cast<uint8_t>(reg_count * 2));
  AppendRegisters(body, values);
  return body;
}

}  // namespace fpssmb
