#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace mbpdu {

enum class ExceptionCode : uint8_t {
  kIllegalFunction = 0x01,
  kIllegalDataAddress = 0x02,
  kIllegalDataValue = 0x03,
  kServerDeviceFailure = 0x04,
  kAcknowledge = 0x05,
  kServerDeviceBusy = 0x06,
  kMemoryParityError = 0x08,
  kGatewayPathUnavailable = 0x0A,
  kGatewayTargetDeviceFailedToRespond = 0x0B
};

/**
 * @brief Human readable name of a raw exception (reason) code
 * @return The enumerator name without the k prefix, or an empty view for unknown codes
 */
[[nodiscard]] std::string_view ExceptionCodeName(uint8_t exception_code) noexcept;

/**
 * @brief Reverse of ExceptionCodeName
 * @return The exception code, or empty if the name is not recognized
 */
[[nodiscard]] std::optional<ExceptionCode> ExceptionCodeFromName(std::string_view name) noexcept;

}  // namespace mbpdu
