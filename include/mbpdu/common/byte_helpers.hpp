#pragma once

#include <cstdint>
#include "wire_format_options.hpp"

namespace mbpdu {

static constexpr uint8_t kMaxByte = 0xFF;
static constexpr uint8_t kBitsPerByte = 8;

static inline constexpr uint8_t GetLowByte(uint16_t value) {
  return value & kMaxByte;
}

static inline constexpr uint8_t GetHighByte(uint16_t value) {
  return (value >> kBitsPerByte) & kMaxByte;
}

static inline constexpr uint16_t MakeUint16(uint8_t low_byte, uint8_t high_byte) {
  return static_cast<uint16_t>(static_cast<uint16_t>(high_byte) << kBitsPerByte | static_cast<uint16_t>(low_byte));
}

/**
 * @brief Write a 16-bit value into two bytes using the given byte order
 * @param value Value to encode
 * @param byte_order Wire byte order
 * @param out Destination, at least two bytes
 */
inline void EncodeU16(uint16_t value, ByteOrder byte_order, uint8_t *out) {
  if (byte_order == ByteOrder::BigEndian) {
    out[0] = GetHighByte(value);
    out[1] = GetLowByte(value);
  } else {
    out[0] = GetLowByte(value);
    out[1] = GetHighByte(value);
  }
}

/**
 * @brief Read a 16-bit value from two consecutive wire bytes
 * @param first First byte on the wire
 * @param second Second byte on the wire
 * @param byte_order Wire byte order
 */
[[nodiscard]] inline constexpr uint16_t DecodeU16(uint8_t first, uint8_t second, ByteOrder byte_order) {
  return byte_order == ByteOrder::BigEndian ? MakeUint16(second, first) : MakeUint16(first, second);
}

}  // namespace mbpdu
