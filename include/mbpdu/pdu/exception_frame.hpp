#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <vector>
#include "../common/exception_code.hpp"
#include "../common/result.hpp"
#include "messages.hpp"

namespace mbpdu {

class FunctionRegistry;

/**
 * @brief Encoder/decoder for exception response PDUs
 *
 * Layout: function_code | 0x80 (1) + exception_code (1)
 */
class ExceptionFrame {
 public:
  static constexpr size_t kExceptionPduSize = 2;

  [[nodiscard]] static std::vector<uint8_t> Encode(uint8_t function_code, uint8_t exception_code);
  [[nodiscard]] static std::vector<uint8_t> Encode(FunctionCode function_code, ExceptionCode exception_code);

  /**
   * @brief Decode an exception PDU
   * @param pdu Complete PDU starting with the flagged function code byte
   * @param registry Source of function names
   * @return Codes and names (empty names for unknown codes), or kTruncatedInput for fewer than 2 bytes
   */
  [[nodiscard]] static Result<ExceptionResponse> Decode(std::span<const uint8_t> pdu, FunctionRegistry const &registry);

  [[nodiscard]] static bool IsException(uint8_t function_code_byte) noexcept {
    return (function_code_byte & kExceptionFunctionCodeMask) != 0;
  }
};

/**
 * @brief Resolve an exception name into the code a producer should answer with
 * @return The code, or empty if the name is not an exception code name
 */
[[nodiscard]] std::optional<ExceptionCode> MakeError(std::string_view exception_name) noexcept;

}  // namespace mbpdu
