#include <cstdint>
#include <span>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>
#include "common/byte_helpers.hpp"
#include "common/function_code.hpp"
#include "pdu/bit_codec.hpp"
#include "pdu/exception_frame.hpp"
#include "pdu/field_codec.hpp"
#include "pdu/function_registry.hpp"
#include "pdu/package.hpp"
#include "pdu/register_codec.hpp"

namespace mbpdu {

namespace {

// Payload layout of each typed message, without the function code byte
template <typename Message>
struct PayloadCodec;

template <FunctionCode kCode>
struct PayloadCodec<ReadRequest<kCode>> {
  static std::vector<uint8_t> Encode(ReadRequest<kCode> const &request, ByteOrder byte_order) {
    return FieldCodec::EncodeAddressQuantity(request.address, request.quantity, byte_order);
  }

  static Result<ReadRequest<kCode>> Decode(std::span<const uint8_t> payload, ByteOrder byte_order) {
    auto fields = FieldCodec::DecodeAddressQuantity(payload, byte_order);
    if (!fields.has_value()) {
      return fields.error();
    }
    return ReadRequest<kCode>{fields->address, fields->quantity};
  }
};

template <FunctionCode kCode>
struct PayloadCodec<ReadBitsResponse<kCode>> {
  static Result<std::vector<uint8_t>> Encode(ReadBitsResponse<kCode> const &response, ByteOrder /*byte_order*/) {
    return BitCodec::EncodeBits(response.bits);
  }

  static Result<ReadBitsResponse<kCode>> Decode(std::span<const uint8_t> payload, ByteOrder /*byte_order*/) {
    return ReadBitsResponse<kCode>{BitCodec::DecodeBits(payload)};
  }
};

template <FunctionCode kCode>
struct PayloadCodec<ReadRegistersResponse<kCode>> {
  static Result<std::vector<uint8_t>> Encode(ReadRegistersResponse<kCode> const &response, ByteOrder /*byte_order*/) {
    return RegisterCodec::EncodeBlocks(std::span<const RegisterBlock>(response.registers));
  }

  static Result<ReadRegistersResponse<kCode>> Decode(std::span<const uint8_t> payload, ByteOrder /*byte_order*/) {
    auto blocks = RegisterCodec::DecodeBlocks(payload);
    if (!blocks.has_value()) {
      return blocks.error();
    }
    return ReadRegistersResponse<kCode>{std::move(*blocks)};
  }
};

// Write Single Coil: the response echoes the request, value 0xFF00 = ON, 0x0000 = OFF
template <typename Message>
struct CoilWriteCodec {
  static std::vector<uint8_t> Encode(Message const &message, ByteOrder byte_order) {
    return FieldCodec::EncodeAddressValue(message.address, message.value ? kCoilOnValue : kCoilOffValue, byte_order);
  }

  static Result<Message> Decode(std::span<const uint8_t> payload, ByteOrder byte_order) {
    auto fields = FieldCodec::DecodeAddressValue(payload, byte_order);
    if (!fields.has_value()) {
      return fields.error();
    }
    // Any value other than 0xFF00 reads as OFF; it is not rejected
    bool const value = DecodeU16(fields->value[0], fields->value[1], byte_order) == kCoilOnValue;
    return Message{fields->address, value};
  }
};

// Write Single Register: the response echoes the request, value bytes are copied untouched
template <typename Message>
struct RegisterWriteCodec {
  static std::vector<uint8_t> Encode(Message const &message, ByteOrder byte_order) {
    return FieldCodec::EncodeAddressValue(message.address, message.value, byte_order);
  }

  static Result<Message> Decode(std::span<const uint8_t> payload, ByteOrder byte_order) {
    auto fields = FieldCodec::DecodeAddressValue(payload, byte_order);
    if (!fields.has_value()) {
      return fields.error();
    }
    return Message{fields->address, fields->value};
  }
};

template <>
struct PayloadCodec<WriteSingleCoilRequest> : CoilWriteCodec<WriteSingleCoilRequest> {};

template <>
struct PayloadCodec<WriteSingleCoilResponse> : CoilWriteCodec<WriteSingleCoilResponse> {};

template <>
struct PayloadCodec<WriteSingleRegisterRequest> : RegisterWriteCodec<WriteSingleRegisterRequest> {};

template <>
struct PayloadCodec<WriteSingleRegisterResponse> : RegisterWriteCodec<WriteSingleRegisterResponse> {};

template <>
struct PayloadCodec<ReadExceptionStatusRequest> {
  static std::vector<uint8_t> Encode(ReadExceptionStatusRequest const & /*request*/, ByteOrder /*byte_order*/) {
    return FieldCodec::EncodeEmpty();
  }

  // Any bytes after the function code are ignored
  static Result<ReadExceptionStatusRequest> Decode(std::span<const uint8_t> /*payload*/, ByteOrder /*byte_order*/) {
    return ReadExceptionStatusRequest{};
  }
};

template <>
struct PayloadCodec<ReadExceptionStatusResponse> {
  static constexpr size_t kStatusSize = 1;

  static Result<std::vector<uint8_t>> Encode(ReadExceptionStatusResponse const &response, ByteOrder /*byte_order*/) {
    return std::vector<uint8_t>{response.status};
  }

  static Result<ReadExceptionStatusResponse> Decode(std::span<const uint8_t> payload, ByteOrder /*byte_order*/) {
    if (payload.size() < kStatusSize) {
      return CodecError::kTruncatedInput;
    }
    return ReadExceptionStatusResponse{payload[0]};
  }
};

template <typename RequestT, typename ResponseT>
FunctionEntry MakeEntry(std::string_view name) {
  static_assert(RequestT::kFunctionCode == ResponseT::kFunctionCode, "request and response must share a code");

  FunctionEntry entry;
  entry.code = RequestT::kFunctionCode;
  entry.name = name;
  entry.encode_request = [](Request const &request, ByteOrder byte_order) {
    return PayloadCodec<RequestT>::Encode(std::get<RequestT>(request), byte_order);
  };
  entry.decode_request = [](std::span<const uint8_t> payload, ByteOrder byte_order) -> Result<Request> {
    auto message = PayloadCodec<RequestT>::Decode(payload, byte_order);
    if (!message.has_value()) {
      return message.error();
    }
    return Request{std::move(*message)};
  };
  entry.encode_response = [](Response const &response, ByteOrder byte_order) -> Result<std::vector<uint8_t>> {
    return PayloadCodec<ResponseT>::Encode(std::get<ResponseT>(response), byte_order);
  };
  entry.decode_response = [](std::span<const uint8_t> payload, ByteOrder byte_order) -> Result<Response> {
    auto message = PayloadCodec<ResponseT>::Decode(payload, byte_order);
    if (!message.has_value()) {
      return message.error();
    }
    return Response{std::move(*message)};
  };
  return entry;
}

}  // namespace

std::vector<uint8_t> FunctionEntry::BuildRequest(Request const &request, ByteOrder byte_order) const {
  return Package(static_cast<uint8_t>(code), encode_request(request, byte_order));
}

Result<Request> FunctionEntry::ParseRequest(std::span<const uint8_t> pdu, ByteOrder byte_order) const {
  if (pdu.empty()) {
    return CodecError::kTruncatedInput;
  }
  return decode_request(pdu.subspan(1), byte_order);
}

Result<std::vector<uint8_t>> FunctionEntry::BuildResponse(Response const &response, ByteOrder byte_order) const {
  auto payload = encode_response(response, byte_order);
  if (!payload.has_value()) {
    return payload.error();
  }
  return Package(static_cast<uint8_t>(code), *payload);
}

Result<Response> FunctionEntry::ParseResponse(std::span<const uint8_t> pdu, ByteOrder byte_order) const {
  if (pdu.empty()) {
    return CodecError::kTruncatedInput;
  }
  return decode_response(pdu.subspan(1), byte_order);
}

std::vector<uint8_t> FunctionEntry::BuildException(ExceptionCode exception_code) const {
  return ExceptionFrame::Encode(code, exception_code);
}

FunctionRegistry::FunctionRegistry()
    : entries_{MakeEntry<ReadCoilsRequest, ReadCoilsResponse>("ReadCoils"),
               MakeEntry<ReadDiscreteInputsRequest, ReadDiscreteInputsResponse>("ReadDiscreteInputs"),
               MakeEntry<ReadHoldingRegistersRequest, ReadHoldingRegistersResponse>("ReadHoldingRegisters"),
               MakeEntry<ReadInputRegistersRequest, ReadInputRegistersResponse>("ReadInputRegisters"),
               MakeEntry<WriteSingleCoilRequest, WriteSingleCoilResponse>("WriteSingleCoil"),
               MakeEntry<WriteSingleRegisterRequest, WriteSingleRegisterResponse>("WriteSingleRegister"),
               MakeEntry<ReadExceptionStatusRequest, ReadExceptionStatusResponse>("ReadExceptionStatus")} {
  index_by_code_.fill(kNoEntry);
  for (size_t i = 0; i < entries_.size(); ++i) {
    index_by_code_[static_cast<uint8_t>(entries_[i].code)] = static_cast<uint8_t>(i);
  }
}

FunctionRegistry const &FunctionRegistry::Standard() {
  static FunctionRegistry const kStandard;
  return kStandard;
}

FunctionEntry const *FunctionRegistry::Find(uint8_t function_code) const noexcept {
  if (function_code >= kFunctionCodeCount || index_by_code_[function_code] == kNoEntry) {
    return nullptr;
  }
  return &entries_[index_by_code_[function_code]];
}

FunctionEntry const *FunctionRegistry::Find(FunctionCode function_code) const noexcept {
  return Find(static_cast<uint8_t>(function_code));
}

FunctionEntry const *FunctionRegistry::Find(std::string_view name) const noexcept {
  for (auto const &entry : entries_) {
    if (entry.name == name) {
      return &entry;
    }
  }
  return nullptr;
}

std::string_view FunctionRegistry::LookupName(uint8_t function_code) const noexcept {
  FunctionEntry const *entry = Find(function_code);
  return entry != nullptr ? entry->name : std::string_view{};
}

}  // namespace mbpdu
