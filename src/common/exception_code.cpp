#include <array>
#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>
#include "common/exception_code.hpp"

namespace mbpdu {

static constexpr std::array<std::pair<ExceptionCode, std::string_view>, 9> kExceptionNames{{
    {ExceptionCode::kIllegalFunction, "IllegalFunction"},
    {ExceptionCode::kIllegalDataAddress, "IllegalDataAddress"},
    {ExceptionCode::kIllegalDataValue, "IllegalDataValue"},
    {ExceptionCode::kServerDeviceFailure, "ServerDeviceFailure"},
    {ExceptionCode::kAcknowledge, "Acknowledge"},
    {ExceptionCode::kServerDeviceBusy, "ServerDeviceBusy"},
    {ExceptionCode::kMemoryParityError, "MemoryParityError"},
    {ExceptionCode::kGatewayPathUnavailable, "GatewayPathUnavailable"},
    {ExceptionCode::kGatewayTargetDeviceFailedToRespond, "GatewayTargetDeviceFailedToRespond"},
}};

std::string_view ExceptionCodeName(uint8_t exception_code) noexcept {
  for (auto const &[code, name] : kExceptionNames) {
    if (static_cast<uint8_t>(code) == exception_code) {
      return name;
    }
  }
  return {};
}

std::optional<ExceptionCode> ExceptionCodeFromName(std::string_view name) noexcept {
  for (auto const &[code, code_name] : kExceptionNames) {
    if (code_name == name) {
      return code;
    }
  }
  return {};
}

}  // namespace mbpdu
