#include <cstdint>
#include <span>
#include <vector>
#include "common/byte_helpers.hpp"
#include "pdu/field_codec.hpp"

namespace mbpdu {

static constexpr uint8_t kFirstFieldIndex{0};
static constexpr uint8_t kSecondFieldIndex{2};
static constexpr uint32_t kMaxRangeCount{0xFFFF};

std::vector<uint8_t> FieldCodec::EncodeAddressQuantity(uint16_t address, uint16_t quantity, ByteOrder byte_order) {
  std::vector<uint8_t> data(kFieldPairSize);
  EncodeU16(address, byte_order, &data[kFirstFieldIndex]);
  EncodeU16(quantity, byte_order, &data[kSecondFieldIndex]);
  return data;
}

Result<AddressQuantity> FieldCodec::DecodeAddressQuantity(std::span<const uint8_t> payload, ByteOrder byte_order) {
  if (payload.size() < kFieldPairSize) {
    return CodecError::kTruncatedInput;
  }

  AddressQuantity fields;
  fields.address = DecodeU16(payload[kFirstFieldIndex], payload[kFirstFieldIndex + 1], byte_order);
  fields.quantity = DecodeU16(payload[kSecondFieldIndex], payload[kSecondFieldIndex + 1], byte_order);
  return fields;
}

Result<std::vector<uint8_t>> FieldCodec::EncodeStartEndAddress(uint16_t start, uint16_t end, ByteOrder byte_order) {
  // The whole 0..65535 span would need a count of 65536, which does not fit the field either
  uint32_t const count = static_cast<uint32_t>(end) - static_cast<uint32_t>(start) + 1;
  if (end < start || count > kMaxRangeCount) {
    return CodecError::kInvalidRange;
  }

  std::vector<uint8_t> data(kFieldPairSize);
  EncodeU16(start, byte_order, &data[kFirstFieldIndex]);
  EncodeU16(static_cast<uint16_t>(count), byte_order, &data[kSecondFieldIndex]);
  return data;
}

Result<StartEndAddress> FieldCodec::DecodeStartEndAddress(std::span<const uint8_t> payload, ByteOrder byte_order) {
  if (payload.size() < kFieldPairSize) {
    return CodecError::kTruncatedInput;
  }

  uint16_t const start = DecodeU16(payload[kFirstFieldIndex], payload[kFirstFieldIndex + 1], byte_order);
  uint16_t const count = DecodeU16(payload[kSecondFieldIndex], payload[kSecondFieldIndex + 1], byte_order);

  StartEndAddress range;
  range.start = start;
  range.end = static_cast<uint16_t>(start + count - 1);
  return range;
}

std::vector<uint8_t> FieldCodec::EncodeAddressValue(uint16_t address, uint16_t value, ByteOrder byte_order) {
  std::vector<uint8_t> data(kFieldPairSize);
  EncodeU16(address, byte_order, &data[kFirstFieldIndex]);
  EncodeU16(value, byte_order, &data[kSecondFieldIndex]);
  return data;
}

std::vector<uint8_t> FieldCodec::EncodeAddressValue(uint16_t address, RegisterBlock value, ByteOrder byte_order) {
  std::vector<uint8_t> data(kFieldPairSize);
  EncodeU16(address, byte_order, &data[kFirstFieldIndex]);
  data[kSecondFieldIndex] = value[0];
  data[kSecondFieldIndex + 1] = value[1];
  return data;
}

Result<AddressValue> FieldCodec::DecodeAddressValue(std::span<const uint8_t> payload, ByteOrder byte_order) {
  if (payload.size() < kFieldPairSize) {
    return CodecError::kTruncatedInput;
  }

  AddressValue fields;
  fields.address = DecodeU16(payload[kFirstFieldIndex], payload[kFirstFieldIndex + 1], byte_order);
  fields.value = {payload[kSecondFieldIndex], payload[kSecondFieldIndex + 1]};
  return fields;
}

}  // namespace mbpdu
