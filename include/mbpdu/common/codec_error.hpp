#pragma once

#include <cstdint>
#include <string_view>

namespace mbpdu {

enum class CodecError : uint8_t {
  // A fixed-width field needs more bytes than the buffer holds
  kTruncatedInput,
  // The payload does not fit behind a one byte length prefix (or a caller buffer)
  kBufferOverflow,
  // Start/end address pair with end before start
  kInvalidRange
};

[[nodiscard]] inline constexpr std::string_view ToString(CodecError error) noexcept {
  switch (error) {
    case CodecError::kTruncatedInput:
      return "truncated input";
    case CodecError::kBufferOverflow:
      return "buffer overflow";
    case CodecError::kInvalidRange:
      return "invalid address range";
  }
  return "unknown error";
}

}  // namespace mbpdu
