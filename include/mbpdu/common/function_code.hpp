#pragma once

#include <cstddef>
#include <cstdint>

namespace mbpdu {

enum class FunctionCode : uint8_t {
  kInvalid = 0,
  kReadCoils = 1,
  kReadDI = 2,
  kReadHR = 3,
  kReadIR = 4,
  kWriteSingleCoil = 5,
  kWriteSingleReg = 6,
  kReadExceptionStatus = 7
};

// Bit 7 of the function code byte flags an exception response
static constexpr uint8_t kExceptionFunctionCodeMask = 0x80;
static constexpr uint8_t kFunctionCodeMask = 0x7F;

// Function codes are 7 bits wide, so a lookup table needs 128 slots
static constexpr size_t kFunctionCodeCount = 128;

static constexpr uint16_t kCoilOnValue = 0xFF00;
static constexpr uint16_t kCoilOffValue = 0x0000;

}  // namespace mbpdu
