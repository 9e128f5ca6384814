#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>
#include "../common/function_code.hpp"
#include "payload.hpp"

namespace mbpdu {

// Read requests (0x01 - 0x04) share the address + quantity layout
template <FunctionCode kCode>
struct ReadRequest {
  static constexpr FunctionCode kFunctionCode = kCode;

  uint16_t address{0};
  uint16_t quantity{0};

  bool operator==(ReadRequest const &) const = default;
};

using ReadCoilsRequest = ReadRequest<FunctionCode::kReadCoils>;
using ReadDiscreteInputsRequest = ReadRequest<FunctionCode::kReadDI>;
using ReadHoldingRegistersRequest = ReadRequest<FunctionCode::kReadHR>;
using ReadInputRegistersRequest = ReadRequest<FunctionCode::kReadIR>;

struct WriteSingleCoilRequest {
  static constexpr FunctionCode kFunctionCode = FunctionCode::kWriteSingleCoil;

  uint16_t address{0};
  bool value{false};

  bool operator==(WriteSingleCoilRequest const &) const = default;
};

struct WriteSingleRegisterRequest {
  static constexpr FunctionCode kFunctionCode = FunctionCode::kWriteSingleReg;

  uint16_t address{0};
  RegisterBlock value{};

  bool operator==(WriteSingleRegisterRequest const &) const = default;
};

struct ReadExceptionStatusRequest {
  static constexpr FunctionCode kFunctionCode = FunctionCode::kReadExceptionStatus;

  bool operator==(ReadExceptionStatusRequest const &) const = default;
};

// Bit read responses (0x01, 0x02)
template <FunctionCode kCode>
struct ReadBitsResponse {
  static constexpr FunctionCode kFunctionCode = kCode;

  std::vector<bool> bits{};

  bool operator==(ReadBitsResponse const &) const = default;
};

using ReadCoilsResponse = ReadBitsResponse<FunctionCode::kReadCoils>;
using ReadDiscreteInputsResponse = ReadBitsResponse<FunctionCode::kReadDI>;

// Register read responses (0x03, 0x04)
template <FunctionCode kCode>
struct ReadRegistersResponse {
  static constexpr FunctionCode kFunctionCode = kCode;

  std::vector<RegisterBlock> registers{};

  bool operator==(ReadRegistersResponse const &) const = default;
};

using ReadHoldingRegistersResponse = ReadRegistersResponse<FunctionCode::kReadHR>;
using ReadInputRegistersResponse = ReadRegistersResponse<FunctionCode::kReadIR>;

// Single writes echo the request
struct WriteSingleCoilResponse {
  static constexpr FunctionCode kFunctionCode = FunctionCode::kWriteSingleCoil;

  uint16_t address{0};
  bool value{false};

  bool operator==(WriteSingleCoilResponse const &) const = default;
};

struct WriteSingleRegisterResponse {
  static constexpr FunctionCode kFunctionCode = FunctionCode::kWriteSingleReg;

  uint16_t address{0};
  RegisterBlock value{};

  bool operator==(WriteSingleRegisterResponse const &) const = default;
};

struct ReadExceptionStatusResponse {
  static constexpr FunctionCode kFunctionCode = FunctionCode::kReadExceptionStatus;

  uint8_t status{0};

  bool operator==(ReadExceptionStatusResponse const &) const = default;
};

/**
 * @brief Decoded exception frame (function code byte with bit 7 set)
 *
 * Names are empty when the function or exception code is not known.
 */
struct ExceptionResponse {
  uint8_t function_code{0};  // bit 7 cleared
  uint8_t exception_code{0};
  std::string function_name{};
  std::string exception_name{};

  bool operator==(ExceptionResponse const &) const = default;
};

/**
 * @brief PDU whose function code has no registry entry; carries the raw payload through
 */
struct UnsupportedPdu {
  uint8_t function_code{0};
  std::vector<uint8_t> data{};

  bool operator==(UnsupportedPdu const &) const = default;
};

using Request = std::variant<ReadCoilsRequest, ReadDiscreteInputsRequest, ReadHoldingRegistersRequest,
                             ReadInputRegistersRequest, WriteSingleCoilRequest, WriteSingleRegisterRequest,
                             ReadExceptionStatusRequest, UnsupportedPdu>;

using Response = std::variant<ReadCoilsResponse, ReadDiscreteInputsResponse, ReadHoldingRegistersResponse,
                              ReadInputRegistersResponse, WriteSingleCoilResponse, WriteSingleRegisterResponse,
                              ReadExceptionStatusResponse, ExceptionResponse, UnsupportedPdu>;

// Number of function codes with typed messages; keeps the registry table in step
static constexpr size_t kSupportedFunctionCount = 7;
static_assert(std::variant_size_v<Request> == kSupportedFunctionCount + 1);
static_assert(std::variant_size_v<Response> == kSupportedFunctionCount + 2);

}  // namespace mbpdu
