#include <algorithm>
#include <cstdint>
#include <span>
#include <vector>
#include "common/byte_helpers.hpp"
#include "pdu/bit_codec.hpp"

namespace mbpdu {

static constexpr size_t kByteCountIndex{0};
static constexpr size_t kFirstDataIndex{1};

Result<std::vector<uint8_t>> BitCodec::EncodeBits(std::vector<bool> const &bits) {
  if (bits.size() > kMaxBits) {
    return CodecError::kBufferOverflow;
  }

  size_t const byte_count = (bits.size() + kBitsPerByte - 1) / kBitsPerByte;
  std::vector<uint8_t> buffer(byte_count + 1, 0x00);
  buffer[kByteCountIndex] = static_cast<uint8_t>(byte_count);

  for (size_t i = 0; i < bits.size(); ++i) {
    if (bits[i]) {
      buffer[kFirstDataIndex + i / kBitsPerByte] |= static_cast<uint8_t>(1U << (i % kBitsPerByte));
    }
  }

  return buffer;
}

std::vector<bool> BitCodec::DecodeBits(std::span<const uint8_t> buffer) {
  std::vector<bool> bits;
  if (buffer.empty()) {
    return bits;
  }

  size_t const end = std::min(buffer.size(), static_cast<size_t>(buffer[kByteCountIndex]) + 1);
  bits.reserve((end - kFirstDataIndex) * kBitsPerByte);
  for (size_t i = kFirstDataIndex; i < end; ++i) {
    for (uint8_t bit = 0; bit < kBitsPerByte; ++bit) {
      bits.push_back((buffer[i] & (1U << bit)) != 0);
    }
  }

  return bits;
}

}  // namespace mbpdu
