#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>
#include "common/exception_code.hpp"
#include "common/function_code.hpp"
#include "pdu/exception_frame.hpp"
#include "pdu/function_registry.hpp"
#include "pdu/package.hpp"
#include "pdu/pdu_codec.hpp"

namespace mbpdu {

uint8_t FunctionCodeOf(Request const &request) noexcept {
  return std::visit(
      [](auto const &message) -> uint8_t {
        using Message = std::decay_t<decltype(message)>;
        if constexpr (std::is_same_v<Message, UnsupportedPdu>) {
          return message.function_code;
        } else {
          return static_cast<uint8_t>(Message::kFunctionCode);
        }
      },
      request);
}

uint8_t FunctionCodeOf(Response const &response) noexcept {
  return std::visit(
      [](auto const &message) -> uint8_t {
        using Message = std::decay_t<decltype(message)>;
        if constexpr (std::is_same_v<Message, UnsupportedPdu>) {
          return message.function_code;
        } else if constexpr (std::is_same_v<Message, ExceptionResponse>) {
          return static_cast<uint8_t>(message.function_code | kExceptionFunctionCodeMask);
        } else {
          return static_cast<uint8_t>(Message::kFunctionCode);
        }
      },
      response);
}

std::vector<uint8_t> PduCodec::BuildRequest(Request const &request) const {
  if (auto const *unsupported = std::get_if<UnsupportedPdu>(&request)) {
    return Package(unsupported->function_code, unsupported->data);
  }

  // The registry has an entry for every typed alternative
  FunctionEntry const *entry = registry_.Find(FunctionCodeOf(request));
  return entry->BuildRequest(request, options_.byte_order);
}

Result<Request> PduCodec::ParseRequest(std::span<const uint8_t> pdu) const {
  if (pdu.empty()) {
    return CodecError::kTruncatedInput;
  }

  FunctionEntry const *entry = registry_.Find(pdu[0]);
  if (entry == nullptr) {
    auto const data = pdu.subspan(1);
    return Request{UnsupportedPdu{pdu[0], std::vector<uint8_t>(data.begin(), data.end())}};
  }

  return entry->ParseRequest(pdu, options_.byte_order);
}

Result<std::vector<uint8_t>> PduCodec::BuildResponse(Response const &response) const {
  if (auto const *unsupported = std::get_if<UnsupportedPdu>(&response)) {
    return Package(unsupported->function_code, unsupported->data);
  }
  if (auto const *exception = std::get_if<ExceptionResponse>(&response)) {
    return ExceptionFrame::Encode(exception->function_code, exception->exception_code);
  }

  FunctionEntry const *entry = registry_.Find(FunctionCodeOf(response));
  return entry->BuildResponse(response, options_.byte_order);
}

Result<Response> PduCodec::ParseResponse(std::span<const uint8_t> pdu) const {
  if (pdu.empty()) {
    return CodecError::kTruncatedInput;
  }

  if (ExceptionFrame::IsException(pdu[0])) {
    auto exception = ExceptionFrame::Decode(pdu, registry_);
    if (!exception.has_value()) {
      return exception.error();
    }
    return Response{std::move(*exception)};
  }

  FunctionEntry const *entry = registry_.Find(pdu[0]);
  if (entry == nullptr) {
    auto const data = pdu.subspan(1);
    return Response{UnsupportedPdu{pdu[0], std::vector<uint8_t>(data.begin(), data.end())}};
  }

  return entry->ParseResponse(pdu, options_.byte_order);
}

std::vector<uint8_t> PduCodec::BuildExceptionResponse(FunctionCode function_code,
                                                      ExceptionCode exception_code) const {
  return ExceptionFrame::Encode(function_code, exception_code);
}

std::optional<std::vector<uint8_t>> PduCodec::BuildExceptionResponse(std::string_view function_name,
                                                                     ExceptionCode exception_code) const {
  FunctionEntry const *entry = registry_.Find(function_name);
  if (entry == nullptr) {
    return {};
  }
  return entry->BuildException(exception_code);
}

std::string_view PduCodec::LookupFunctionName(uint8_t function_code) const noexcept {
  return registry_.LookupName(function_code);
}

std::string_view PduCodec::LookupReasonName(uint8_t exception_code) const noexcept {
  return ExceptionCodeName(exception_code);
}

std::string_view PduCodec::FunctionNameOf(Request const &request) const noexcept {
  if (std::holds_alternative<UnsupportedPdu>(request)) {
    return {};
  }
  return registry_.LookupName(FunctionCodeOf(request));
}

std::string_view PduCodec::FunctionNameOf(Response const &response) const noexcept {
  if (std::holds_alternative<UnsupportedPdu>(response)) {
    return {};
  }
  return registry_.LookupName(FunctionCodeOf(response) & kFunctionCodeMask);
}

}  // namespace mbpdu
