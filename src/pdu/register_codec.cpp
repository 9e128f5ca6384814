#include <algorithm>
#include <cstdint>
#include <span>
#include <vector>
#include "common/byte_helpers.hpp"
#include "pdu/register_codec.hpp"

namespace mbpdu {

static constexpr size_t kByteCountIndex{0};
static constexpr size_t kFirstDataIndex{1};

Result<std::vector<uint8_t>> RegisterCodec::EncodeBlocks(std::span<const RegisterBlock> blocks) {
  if (blocks.size() > kMaxRegisters) {
    return CodecError::kBufferOverflow;
  }

  std::vector<uint8_t> buffer;
  buffer.reserve(kFirstDataIndex + blocks.size() * kBytesPerRegister);
  buffer.push_back(static_cast<uint8_t>(blocks.size() * kBytesPerRegister));
  for (auto const &block : blocks) {
    buffer.insert(buffer.end(), block.begin(), block.end());
  }

  return buffer;
}

Result<std::vector<uint8_t>> RegisterCodec::EncodeBlocks(std::span<const std::vector<uint8_t>> blocks) {
  if (blocks.size() > kMaxRegisters) {
    return CodecError::kBufferOverflow;
  }

  std::vector<uint8_t> buffer(kFirstDataIndex + blocks.size() * kBytesPerRegister, 0x00);
  buffer[kByteCountIndex] = static_cast<uint8_t>(blocks.size() * kBytesPerRegister);
  for (size_t i = 0; i < blocks.size(); ++i) {
    size_t const copy_size = std::min(blocks[i].size(), kBytesPerRegister);
    std::copy_n(blocks[i].begin(), copy_size, buffer.begin() + kFirstDataIndex + i * kBytesPerRegister);
  }

  return buffer;
}

Result<std::vector<uint8_t>> RegisterCodec::EncodeRegisters(std::span<const uint16_t> registers, ByteOrder byte_order) {
  if (registers.size() > kMaxRegisters) {
    return CodecError::kBufferOverflow;
  }

  std::vector<uint8_t> buffer(kFirstDataIndex + registers.size() * kBytesPerRegister);
  buffer[kByteCountIndex] = static_cast<uint8_t>(registers.size() * kBytesPerRegister);
  for (size_t i = 0; i < registers.size(); ++i) {
    EncodeU16(registers[i], byte_order, &buffer[kFirstDataIndex + i * kBytesPerRegister]);
  }

  return buffer;
}

Result<std::vector<uint8_t>> RegisterCodec::EncodeRawBlocks(std::span<const uint8_t> bytes) {
  if (bytes.size() > kMaxPayloadBytes) {
    return CodecError::kBufferOverflow;
  }

  std::vector<uint8_t> buffer;
  buffer.reserve(kFirstDataIndex + bytes.size());
  buffer.push_back(static_cast<uint8_t>(bytes.size()));
  buffer.insert(buffer.end(), bytes.begin(), bytes.end());
  return buffer;
}

Result<std::vector<RegisterBlock>> RegisterCodec::DecodeBlocks(std::span<const uint8_t> buffer) {
  if (buffer.empty()) {
    return CodecError::kTruncatedInput;
  }

  size_t const byte_count = buffer[kByteCountIndex];
  if (buffer.size() < kFirstDataIndex + byte_count) {
    return CodecError::kTruncatedInput;
  }

  // An odd byte count leaves a half register at the end; it is zero-padded
  size_t const register_count = (byte_count + 1) / kBytesPerRegister;
  std::vector<RegisterBlock> blocks(register_count, RegisterBlock{});
  for (size_t i = 0; i < byte_count; ++i) {
    blocks[i / kBytesPerRegister][i % kBytesPerRegister] = buffer[kFirstDataIndex + i];
  }

  return blocks;
}

Result<std::vector<uint16_t>> RegisterCodec::DecodeRegisters(std::span<const uint8_t> buffer, ByteOrder byte_order) {
  auto blocks = DecodeBlocks(buffer);
  if (!blocks.has_value()) {
    return blocks.error();
  }

  std::vector<uint16_t> registers;
  registers.reserve(blocks->size());
  for (auto const &block : *blocks) {
    registers.push_back(DecodeU16(block[0], block[1], byte_order));
  }

  return registers;
}

Result<size_t> RegisterCodec::CopyBlocks(std::span<uint8_t> destination, std::span<const RegisterBlock> blocks,
                                         size_t offset) {
  if (offset > destination.size() || destination.size() - offset < blocks.size() * kBytesPerRegister) {
    return CodecError::kBufferOverflow;
  }

  for (size_t i = 0; i < blocks.size(); ++i) {
    std::copy(blocks[i].begin(), blocks[i].end(), destination.begin() + offset + i * kBytesPerRegister);
  }

  return blocks.size() * kBytesPerRegister;
}

}  // namespace mbpdu
