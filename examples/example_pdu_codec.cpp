/**
 * @file example_pdu_codec.cpp
 * @brief Example use of the mbpdu codec
 *
 * Builds a few request and response PDUs, prints their bytes and decodes them again.
 * A transport layer would add its own framing (RTU address + CRC, TCP MBAP header)
 * around these PDUs.
 */

#include <cstdint>
#include <iomanip>
#include <iostream>
#include <span>
#include <variant>
#include <vector>
#include "mbpdu/common/codec_error.hpp"
#include "mbpdu/common/exception_code.hpp"
#include "mbpdu/pdu/messages.hpp"
#include "mbpdu/pdu/pdu_codec.hpp"

namespace {

void PrintPdu(char const *label, std::span<const uint8_t> pdu) {
  std::cout << "  " << label << ":";
  for (uint8_t byte : pdu) {
    std::cout << " " << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
  }
  std::cout << std::dec << std::setfill(' ') << "\n";
}

}  // namespace

int main() {
  using mbpdu::ExceptionCode;
  using mbpdu::ExceptionResponse;
  using mbpdu::PduCodec;
  using mbpdu::ReadCoilsRequest;
  using mbpdu::ReadHoldingRegistersResponse;
  using mbpdu::UnsupportedPdu;
  using mbpdu::WriteSingleCoilResponse;

  PduCodec codec;

  // Example 1: Read coils request
  std::cout << "Example 1: Read 10 coils starting at address 5...\n";
  auto read_coils = codec.BuildRequest(ReadCoilsRequest{5, 10});
  PrintPdu("request", read_coils);
  auto request = codec.ParseRequest(read_coils);
  if (request.has_value()) {
    auto const &fields = std::get<ReadCoilsRequest>(*request);
    std::cout << "  Parsed " << codec.FunctionNameOf(*request) << " address=" << fields.address
              << " quantity=" << fields.quantity << "\n";
  }

  // Example 2: Write single coil response
  std::cout << "\nExample 2: Write single coil response...\n";
  auto write_coil = codec.BuildResponse(WriteSingleCoilResponse{10, true});
  if (write_coil.has_value()) {
    PrintPdu("response", *write_coil);
  } else {
    std::cout << "  Failed to build response: " << mbpdu::ToString(write_coil.error()) << "\n";
  }

  // Example 3: Holding register response
  std::cout << "\nExample 3: Decoding a holding register response...\n";
  std::vector<uint8_t> const registers_pdu{0x03, 0x06, 0x02, 0x2B, 0x00, 0x00, 0x00, 0x64};
  auto registers = codec.ParseResponse(registers_pdu);
  if (registers.has_value() && std::holds_alternative<ReadHoldingRegistersResponse>(*registers)) {
    auto const &blocks = std::get<ReadHoldingRegistersResponse>(*registers).registers;
    for (size_t i = 0; i < blocks.size(); ++i) {
      std::cout << "  Register[" << i << "] = " << ((blocks[i][0] << 8) | blocks[i][1]) << "\n";
    }
  }

  // Example 4: Exception response
  std::cout << "\nExample 4: Exception response...\n";
  auto exception_pdu = codec.BuildExceptionResponse("ReadHoldingRegisters", ExceptionCode::kIllegalDataAddress);
  if (exception_pdu.has_value()) {
    PrintPdu("response", *exception_pdu);
    auto response = codec.ParseResponse(*exception_pdu);
    if (response.has_value()) {
      auto const &exception = std::get<ExceptionResponse>(*response);
      std::cout << "  " << exception.function_name << " failed: " << exception.exception_name << "\n";
    }
  }

  // Example 5: Unsupported function code
  std::cout << "\nExample 5: Unsupported function code 0x2B...\n";
  std::vector<uint8_t> const unsupported_pdu{0x2B, 0x01, 0x02};
  auto unsupported = codec.ParseRequest(unsupported_pdu);
  if (unsupported.has_value() && std::holds_alternative<UnsupportedPdu>(*unsupported)) {
    auto const &raw = std::get<UnsupportedPdu>(*unsupported);
    std::cout << "  Passing through code 0x" << std::hex << static_cast<int>(raw.function_code) << std::dec << " with "
              << raw.data.size() << " data bytes\n";
  }

  // Example 6: Truncated input
  std::cout << "\nExample 6: Truncated read request...\n";
  std::vector<uint8_t> const truncated_pdu{0x03, 0x00};
  auto truncated = codec.ParseRequest(truncated_pdu);
  if (!truncated.has_value()) {
    std::cout << "  Rejected: " << mbpdu::ToString(truncated.error()) << "\n";
  }

  std::cout << "\nPDU codec examples completed!\n";
  return 0;
}
