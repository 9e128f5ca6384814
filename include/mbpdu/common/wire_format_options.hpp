#pragma once

#include <cstdint>

namespace mbpdu {

/**
 * @brief Byte order for 16-bit values on the wire.
 */
enum class ByteOrder {
  /** High byte first (standard Modbus, big-endian) */
  BigEndian,
  /** Low byte first (e.g. Enron Modbus, little-endian) */
  LittleEndian
};

/**
 * @brief Wire format options applied to every 16-bit integer field of a PDU.
 *
 * Raw two-byte register values are copied as-is and are not affected.
 */
struct WireFormatOptions {
  ByteOrder byte_order{ByteOrder::BigEndian};
};

}  // namespace mbpdu
