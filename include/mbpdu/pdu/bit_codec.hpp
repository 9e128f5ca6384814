#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>
#include "../common/result.hpp"

namespace mbpdu {

/**
 * @brief Packs coil / discrete input states into a length-prefixed byte buffer
 *
 * Layout: byte_count (1) + ceil(bit_count / 8) data bytes. Bits are packed least
 * significant bit first, in input order; unused high bits of the last byte are zero.
 */
class BitCodec {
 public:
  static constexpr size_t kMaxPayloadBytes = 255;
  static constexpr size_t kMaxBits = kMaxPayloadBytes * 8;  // 2040

  /**
   * @brief Pack bits behind a byte-count prefix
   * @param bits Bit states, index 0 lands in bit 0 of the first data byte
   * @return Encoded buffer, or kBufferOverflow for more than kMaxBits bits
   */
  [[nodiscard]] static Result<std::vector<uint8_t>> EncodeBits(std::vector<bool> const &bits);

  /**
   * @brief Unpack a byte-count prefixed bit field
   *
   * Reads at most byte_count data bytes (fewer if the buffer ends first) and emits 8 bits
   * per byte, so the result length is always a multiple of 8. Padding bits come back as false.
   */
  [[nodiscard]] static std::vector<bool> DecodeBits(std::span<const uint8_t> buffer);
};

}  // namespace mbpdu
