#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <vector>
#include "../common/exception_code.hpp"
#include "../common/function_code.hpp"
#include "../common/result.hpp"
#include "../common/wire_format_options.hpp"
#include "function_registry.hpp"
#include "messages.hpp"

namespace mbpdu {

/**
 * @brief Modbus PDU encoder/decoder
 *
 * Converts between PDU bytes (function code + payload, no framing) and typed requests and
 * responses. Function codes without a registry entry are passed through as UnsupportedPdu.
 * A codec holds no mutable state; one instance can serve any number of threads.
 */
class PduCodec {
 public:
  /**
   * @brief Construct a codec
   * @param registry Function table, must outlive the codec
   * @param options Wire format options (byte order of 16-bit fields); default is standard Modbus
   */
  explicit PduCodec(FunctionRegistry const &registry = FunctionRegistry::Standard(), WireFormatOptions options = {})
      : registry_(registry),
        options_(options) {}
  PduCodec(FunctionRegistry const &&registry, WireFormatOptions options = {}) = delete;

  /**
   * @brief Encode a request into a PDU
   * @param request Typed request; UnsupportedPdu is emitted as code + raw data
   * @return PDU bytes starting with the function code
   */
  [[nodiscard]] std::vector<uint8_t> BuildRequest(Request const &request) const;

  /**
   * @brief Decode a request PDU
   * @param pdu Complete PDU (function code + payload)
   * @return Typed request, UnsupportedPdu for unknown codes, or kTruncatedInput if the PDU is
   *         empty or its payload is shorter than the function's fixed fields
   */
  [[nodiscard]] Result<Request> ParseRequest(std::span<const uint8_t> pdu) const;

  /**
   * @brief Encode a response into a PDU
   * @param response Typed response; ExceptionResponse is emitted as an exception frame
   * @return PDU bytes, or kBufferOverflow if a bit/register payload exceeds its length prefix
   */
  [[nodiscard]] Result<std::vector<uint8_t>> BuildResponse(Response const &response) const;

  /**
   * @brief Decode a response PDU
   * @param pdu Complete PDU (function code + payload)
   * @return ExceptionResponse when bit 7 of the function code is set, otherwise the typed
   *         response or UnsupportedPdu; kTruncatedInput for short input
   */
  [[nodiscard]] Result<Response> ParseResponse(std::span<const uint8_t> pdu) const;

  [[nodiscard]] std::vector<uint8_t> BuildExceptionResponse(FunctionCode function_code,
                                                            ExceptionCode exception_code) const;

  /**
   * @brief Build an exception response by function name
   * @return The PDU, or empty if the name is not a supported function
   */
  [[nodiscard]] std::optional<std::vector<uint8_t>> BuildExceptionResponse(std::string_view function_name,
                                                                           ExceptionCode exception_code) const;

  /**
   * @brief Name of a function code, empty if unsupported
   */
  [[nodiscard]] std::string_view LookupFunctionName(uint8_t function_code) const noexcept;

  /**
   * @brief Name of an exception code, empty if unknown
   */
  [[nodiscard]] std::string_view LookupReasonName(uint8_t exception_code) const noexcept;

  /**
   * @brief Function name of a decoded message
   *
   * Empty for UnsupportedPdu; for ExceptionResponse it is the erroring function's name.
   */
  [[nodiscard]] std::string_view FunctionNameOf(Request const &request) const noexcept;
  [[nodiscard]] std::string_view FunctionNameOf(Response const &response) const noexcept;

  [[nodiscard]] FunctionRegistry const &GetRegistry() const noexcept { return registry_; }
  [[nodiscard]] WireFormatOptions const &GetOptions() const noexcept { return options_; }

 private:
  FunctionRegistry const &registry_;
  WireFormatOptions options_;
};

/**
 * @brief Raw function code byte a message is sent with (bit 7 set for exception responses)
 */
[[nodiscard]] uint8_t FunctionCodeOf(Request const &request) noexcept;
[[nodiscard]] uint8_t FunctionCodeOf(Response const &response) noexcept;

}  // namespace mbpdu
