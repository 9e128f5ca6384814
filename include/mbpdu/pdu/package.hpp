#pragma once

#include <cstdint>
#include <span>
#include <vector>

namespace mbpdu {

/**
 * @brief Assemble a PDU from a function code byte and an already encoded payload
 */
[[nodiscard]] inline std::vector<uint8_t> Package(uint8_t function_code, std::span<const uint8_t> payload) {
  std::vector<uint8_t> pdu;
  pdu.reserve(payload.size() + 1);
  pdu.push_back(function_code);
  pdu.insert(pdu.end(), payload.begin(), payload.end());
  return pdu;
}

}  // namespace mbpdu
