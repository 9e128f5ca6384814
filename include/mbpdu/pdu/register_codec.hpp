#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>
#include "../common/result.hpp"
#include "../common/wire_format_options.hpp"
#include "payload.hpp"

namespace mbpdu {

/**
 * @brief Packs register values into a length-prefixed byte buffer
 *
 * Layout: byte_count (1) + register bytes, register 0 first. In register mode byte_count
 * is twice the register count; in raw mode it is the raw byte count.
 */
class RegisterCodec {
 public:
  static constexpr size_t kMaxPayloadBytes = 255;
  static constexpr size_t kBytesPerRegister = 2;
  static constexpr size_t kMaxRegisters = kMaxPayloadBytes / kBytesPerRegister;  // 127

  /**
   * @brief Encode registers given as raw wire bytes
   * @return Encoded buffer, or kBufferOverflow for more than kMaxRegisters registers
   */
  [[nodiscard]] static Result<std::vector<uint8_t>> EncodeBlocks(std::span<const RegisterBlock> blocks);

  /**
   * @brief Encode registers given as variable length byte runs
   *
   * Runs shorter than two bytes are zero padded, longer runs contribute their first two bytes.
   */
  [[nodiscard]] static Result<std::vector<uint8_t>> EncodeBlocks(std::span<const std::vector<uint8_t>> blocks);

  /**
   * @brief Encode numeric register values
   * @param registers Values in register order
   * @param byte_order Byte order of each register on the wire
   */
  [[nodiscard]] static Result<std::vector<uint8_t>> EncodeRegisters(std::span<const uint16_t> registers,
                                                                    ByteOrder byte_order = ByteOrder::BigEndian);

  /**
   * @brief Encode a raw byte run unchanged behind its length
   *
   * Standalone helper: ReadRegistersResponse carries whole blocks. Send a raw run with
   * Package(code, buffer).
   * @return Encoded buffer, or kBufferOverflow for more than kMaxPayloadBytes bytes
   */
  [[nodiscard]] static Result<std::vector<uint8_t>> EncodeRawBlocks(std::span<const uint8_t> bytes);

  /**
   * @brief Decode a register block buffer
   *
   * byte 0 declares the payload byte count. An odd count ends in a half register,
   * returned zero-padded.
   * @return Registers in wire order, or kTruncatedInput if the buffer is empty or shorter
   *         than the declared payload
   */
  [[nodiscard]] static Result<std::vector<RegisterBlock>> DecodeBlocks(std::span<const uint8_t> buffer);

  [[nodiscard]] static Result<std::vector<uint16_t>> DecodeRegisters(std::span<const uint8_t> buffer,
                                                                     ByteOrder byte_order = ByteOrder::BigEndian);

  /**
   * @brief Copy register blocks into an existing buffer starting at a byte offset
   * @return kBufferOverflow if the blocks would run past the end of the destination
   */
  [[nodiscard]] static Result<size_t> CopyBlocks(std::span<uint8_t> destination, std::span<const RegisterBlock> blocks,
                                                 size_t offset);
};

}  // namespace mbpdu
