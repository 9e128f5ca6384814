#include <cstdint>
#include <vector>
#include <gtest/gtest.h>
#include "mbpdu/common/codec_error.hpp"
#include "mbpdu/common/exception_code.hpp"
#include "mbpdu/common/function_code.hpp"
#include "mbpdu/pdu/exception_frame.hpp"
#include "mbpdu/pdu/function_registry.hpp"

using mbpdu::CodecError;
using mbpdu::ExceptionCode;
using mbpdu::ExceptionFrame;
using mbpdu::FunctionCode;
using mbpdu::FunctionRegistry;
using mbpdu::MakeError;

TEST(ExceptionFrame, EncodeSetsHighBit) {
  auto pdu = ExceptionFrame::Encode(uint8_t{0x03}, uint8_t{0x02});
  std::vector<uint8_t> const expected{0x83, 0x02};
  EXPECT_EQ(pdu, expected);
}

TEST(ExceptionFrame, EncodeTypedCodes) {
  auto pdu = ExceptionFrame::Encode(FunctionCode::kWriteSingleCoil, ExceptionCode::kServerDeviceBusy);
  std::vector<uint8_t> const expected{0x85, 0x06};
  EXPECT_EQ(pdu, expected);
}

TEST(ExceptionFrame, DecodeNames) {
  std::vector<uint8_t> const pdu{0x83, 0x02};
  auto exception = ExceptionFrame::Decode(pdu, FunctionRegistry::Standard());
  ASSERT_TRUE(exception.has_value());
  EXPECT_EQ(exception->function_code, 0x03);
  EXPECT_EQ(exception->exception_code, 0x02);
  EXPECT_EQ(exception->function_name, "ReadHoldingRegisters");
  EXPECT_EQ(exception->exception_name, "IllegalDataAddress");
}

TEST(ExceptionFrame, DecodeUnknownCodesGiveEmptyNames) {
  std::vector<uint8_t> const pdu{0xAB, 0x07};
  auto exception = ExceptionFrame::Decode(pdu, FunctionRegistry::Standard());
  ASSERT_TRUE(exception.has_value());
  EXPECT_EQ(exception->function_code, 0x2B);
  EXPECT_EQ(exception->exception_code, 0x07);
  EXPECT_TRUE(exception->function_name.empty());
  EXPECT_TRUE(exception->exception_name.empty());
}

TEST(ExceptionFrame, DecodeTruncated) {
  std::vector<uint8_t> const pdu{0x81};
  auto exception = ExceptionFrame::Decode(pdu, FunctionRegistry::Standard());
  ASSERT_FALSE(exception.has_value());
  EXPECT_EQ(exception.error(), CodecError::kTruncatedInput);
}

TEST(ExceptionFrame, EveryExceptionCodeRoundTrips) {
  static constexpr ExceptionCode kCodes[] = {
      ExceptionCode::kIllegalFunction,        ExceptionCode::kIllegalDataAddress,
      ExceptionCode::kIllegalDataValue,       ExceptionCode::kServerDeviceFailure,
      ExceptionCode::kAcknowledge,            ExceptionCode::kServerDeviceBusy,
      ExceptionCode::kMemoryParityError,      ExceptionCode::kGatewayPathUnavailable,
      ExceptionCode::kGatewayTargetDeviceFailedToRespond};

  for (auto code : kCodes) {
    auto pdu = ExceptionFrame::Encode(FunctionCode::kReadCoils, code);
    auto exception = ExceptionFrame::Decode(pdu, FunctionRegistry::Standard());
    ASSERT_TRUE(exception.has_value());
    EXPECT_EQ(exception->function_name, "ReadCoils");
    EXPECT_EQ(MakeError(exception->exception_name), code);
  }
}

TEST(ExceptionFrame, IsException) {
  EXPECT_TRUE(ExceptionFrame::IsException(0x81));
  EXPECT_TRUE(ExceptionFrame::IsException(0xFF));
  EXPECT_FALSE(ExceptionFrame::IsException(0x01));
  EXPECT_FALSE(ExceptionFrame::IsException(0x7F));
}

TEST(ExceptionFrame, MakeError) {
  auto error = MakeError("IllegalDataValue");
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(*error, ExceptionCode::kIllegalDataValue);
  EXPECT_EQ(static_cast<uint8_t>(*error), 0x03);

  EXPECT_FALSE(MakeError("NoSuchException").has_value());
}
