#include <cstdint>
#include <span>
#include <string_view>
#include <vector>
#include "common/exception_code.hpp"
#include "common/function_code.hpp"
#include "pdu/exception_frame.hpp"
#include "pdu/function_registry.hpp"

namespace mbpdu {

std::optional<ExceptionCode> MakeError(std::string_view exception_name) noexcept {
  return ExceptionCodeFromName(exception_name);
}

std::vector<uint8_t> ExceptionFrame::Encode(uint8_t function_code, uint8_t exception_code) {
  return {static_cast<uint8_t>(function_code | kExceptionFunctionCodeMask), exception_code};
}

std::vector<uint8_t> ExceptionFrame::Encode(FunctionCode function_code, ExceptionCode exception_code) {
  return Encode(static_cast<uint8_t>(function_code), static_cast<uint8_t>(exception_code));
}

Result<ExceptionResponse> ExceptionFrame::Decode(std::span<const uint8_t> pdu, FunctionRegistry const &registry) {
  if (pdu.size() < kExceptionPduSize) {
    return CodecError::kTruncatedInput;
  }

  ExceptionResponse response;
  response.function_code = pdu[0] & kFunctionCodeMask;
  response.exception_code = pdu[1];
  response.function_name = std::string{registry.LookupName(response.function_code)};
  response.exception_name = std::string{ExceptionCodeName(response.exception_code)};
  return response;
}

}  // namespace mbpdu
