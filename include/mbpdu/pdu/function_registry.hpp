#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>
#include "../common/exception_code.hpp"
#include "../common/function_code.hpp"
#include "../common/result.hpp"
#include "../common/wire_format_options.hpp"
#include "messages.hpp"

namespace mbpdu {

/**
 * @brief Request/response codecs of one supported function code
 *
 * The payload function pointers work on the bytes after the function code. The member
 * functions add (or strip) the function code byte around them. An entry only accepts
 * messages of its own function; the Request / Response alternative passed to an encoder
 * must carry this entry's code.
 */
struct FunctionEntry {
  using RequestEncoder = std::vector<uint8_t> (*)(Request const &request, ByteOrder byte_order);
  using RequestDecoder = Result<Request> (*)(std::span<const uint8_t> payload, ByteOrder byte_order);
  using ResponseEncoder = Result<std::vector<uint8_t>> (*)(Response const &response, ByteOrder byte_order);
  using ResponseDecoder = Result<Response> (*)(std::span<const uint8_t> payload, ByteOrder byte_order);

  FunctionCode code{FunctionCode::kInvalid};
  std::string_view name{};
  RequestEncoder encode_request{nullptr};
  RequestDecoder decode_request{nullptr};
  ResponseEncoder encode_response{nullptr};
  ResponseDecoder decode_response{nullptr};

  [[nodiscard]] std::vector<uint8_t> BuildRequest(Request const &request,
                                                  ByteOrder byte_order = ByteOrder::BigEndian) const;

  /**
   * @brief Decode a complete request PDU of this function
   * @return The typed request, or kTruncatedInput if the PDU or its payload is too short
   */
  [[nodiscard]] Result<Request> ParseRequest(std::span<const uint8_t> pdu,
                                             ByteOrder byte_order = ByteOrder::BigEndian) const;

  [[nodiscard]] Result<std::vector<uint8_t>> BuildResponse(Response const &response,
                                                           ByteOrder byte_order = ByteOrder::BigEndian) const;

  [[nodiscard]] Result<Response> ParseResponse(std::span<const uint8_t> pdu,
                                               ByteOrder byte_order = ByteOrder::BigEndian) const;

  /**
   * @brief Build an exception response PDU for this function
   */
  [[nodiscard]] std::vector<uint8_t> BuildException(ExceptionCode exception_code) const;
};

/**
 * @brief Immutable table of the supported function codes
 *
 * Built once; lookups by code are a direct array index. The registry holds no mutable
 * state after construction and can be shared between threads.
 */
class FunctionRegistry {
 public:
  /**
   * @brief Build the table of the standard function codes (0x01 - 0x07)
   */
  FunctionRegistry();

  /**
   * @brief Process-wide instance of the standard table
   */
  [[nodiscard]] static FunctionRegistry const &Standard();

  /**
   * @brief Find the entry for a function code byte
   * @return The entry, or nullptr for unsupported codes (including codes with bit 7 set)
   */
  [[nodiscard]] FunctionEntry const *Find(uint8_t function_code) const noexcept;
  [[nodiscard]] FunctionEntry const *Find(FunctionCode function_code) const noexcept;

  /**
   * @brief Find the entry by function name (e.g. "ReadCoils")
   */
  [[nodiscard]] FunctionEntry const *Find(std::string_view name) const noexcept;

  /**
   * @brief Name of a function code, or an empty view for unsupported codes
   */
  [[nodiscard]] std::string_view LookupName(uint8_t function_code) const noexcept;

  [[nodiscard]] std::span<const FunctionEntry> Entries() const noexcept { return entries_; }

 private:
  static constexpr uint8_t kNoEntry = 0xFF;

  std::array<FunctionEntry, kSupportedFunctionCount> entries_;
  std::array<uint8_t, kFunctionCodeCount> index_by_code_{};
};

}  // namespace mbpdu
