#pragma once

#include <cstdint>

namespace fpssmb {

enum class FunctionCode : uint8_t {
  kInvalid = 0,
  kReadHR = 3,
  kWriteMultRegs = 16
};

static constexpr uint8_t kExceptionFunctionCodeMask = 0x80;
static constexpr uint8_t kFunctionCodeMask = 0x7F;

[[nodiscard]] inline constexpr bool IsExceptionFunctionCode(uint8_t function_code_byte) {
  return (function_code_byte & kExceptionFunctionCodeMask) != 0;
}

}  // namespace fpssmb
