#pragma once

#include <cstdint>
#include <span>
#include <vector>
#include "../common/result.hpp"
#include "../common/wire_format_options.hpp"
#include "payload.hpp"

namespace mbpdu {

/**
 * @brief Fixed-width field layouts shared by the request and response payloads
 *
 * Every encoder returns a freshly allocated buffer; every decoder reads from the start of
 * the given payload (function code already stripped) and ignores trailing bytes.
 */
class FieldCodec {
 public:
  static constexpr size_t kFieldPairSize = 4;  // two 16-bit fields

  /**
   * @brief Encode an address followed by a quantity
   * @return 4 bytes
   */
  [[nodiscard]] static std::vector<uint8_t> EncodeAddressQuantity(uint16_t address, uint16_t quantity,
                                                                  ByteOrder byte_order = ByteOrder::BigEndian);

  /**
   * @brief Decode an address followed by a quantity
   * @return The pair, or kTruncatedInput for fewer than 4 bytes
   */
  [[nodiscard]] static Result<AddressQuantity> DecodeAddressQuantity(std::span<const uint8_t> payload,
                                                                     ByteOrder byte_order = ByteOrder::BigEndian);

  /**
   * @brief Encode an inclusive address range as start + count
   * @return 4 bytes, or kInvalidRange when end < start
   */
  [[nodiscard]] static Result<std::vector<uint8_t>> EncodeStartEndAddress(uint16_t start, uint16_t end,
                                                                          ByteOrder byte_order = ByteOrder::BigEndian);

  /**
   * @brief Decode start + count back into an inclusive range (end = start + count - 1)
   * @return The range, or kTruncatedInput for fewer than 4 bytes
   */
  [[nodiscard]] static Result<StartEndAddress> DecodeStartEndAddress(std::span<const uint8_t> payload,
                                                                     ByteOrder byte_order = ByteOrder::BigEndian);

  [[nodiscard]] static std::vector<uint8_t> EncodeAddressValue(uint16_t address, uint16_t value,
                                                               ByteOrder byte_order = ByteOrder::BigEndian);
  [[nodiscard]] static std::vector<uint8_t> EncodeAddressValue(uint16_t address, RegisterBlock value,
                                                               ByteOrder byte_order = ByteOrder::BigEndian);

  /**
   * @brief Decode an address followed by two uninterpreted value bytes
   * @return The pair, or kTruncatedInput for fewer than 4 bytes
   */
  [[nodiscard]] static Result<AddressValue> DecodeAddressValue(std::span<const uint8_t> payload,
                                                               ByteOrder byte_order = ByteOrder::BigEndian);

  [[nodiscard]] static std::vector<uint8_t> EncodeEmpty() { return {}; }
  [[nodiscard]] static EmptyPayload DecodeEmpty(std::span<const uint8_t> /*payload*/) { return {}; }
};

}  // namespace mbpdu
