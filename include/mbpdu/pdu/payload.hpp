#pragma once

#include <array>
#include <cstdint>

namespace mbpdu {

// One register as it travels on the wire, first wire byte at index 0
using RegisterBlock = std::array<uint8_t, 2>;

struct AddressQuantity {
  uint16_t address{0};
  uint16_t quantity{0};

  bool operator==(AddressQuantity const &) const = default;
};

// Inclusive address range, carried on the wire as start + count
struct StartEndAddress {
  uint16_t start{0};
  uint16_t end{0};

  bool operator==(StartEndAddress const &) const = default;
};

// The value is kept as raw wire bytes: coils and registers read them differently
struct AddressValue {
  uint16_t address{0};
  RegisterBlock value{};

  bool operator==(AddressValue const &) const = default;
};

struct EmptyPayload {
  bool operator==(EmptyPayload const &) const = default;
};

}  // namespace mbpdu
