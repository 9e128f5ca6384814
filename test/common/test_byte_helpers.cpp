#include <gtest/gtest.h>
#include "mbpdu/common/byte_helpers.hpp"
#include "mbpdu/common/wire_format_options.hpp"

using mbpdu::ByteOrder;
using mbpdu::DecodeU16;
using mbpdu::EncodeU16;
using mbpdu::GetHighByte;
using mbpdu::GetLowByte;
using mbpdu::MakeUint16;

TEST(ByteHelpers, HighAndLowByte) {
  EXPECT_EQ(GetHighByte(0x1234), 0x12);
  EXPECT_EQ(GetLowByte(0x1234), 0x34);
  EXPECT_EQ(GetHighByte(0x00FF), 0x00);
  EXPECT_EQ(GetLowByte(0xFF00), 0x00);
}

TEST(ByteHelpers, MakeUint16) {
  EXPECT_EQ(MakeUint16(0x34, 0x12), 0x1234);
  EXPECT_EQ(MakeUint16(0xFF, 0xFF), 0xFFFF);
  EXPECT_EQ(MakeUint16(0x00, 0x80), 0x8000);
}

TEST(ByteHelpersCodec, EncodeU16_DecodeU16_BigEndian) {
  uint8_t buf[2];
  EncodeU16(0x1234, ByteOrder::BigEndian, buf);
  EXPECT_EQ(buf[0], 0x12);
  EXPECT_EQ(buf[1], 0x34);
  EXPECT_EQ(DecodeU16(buf[0], buf[1], ByteOrder::BigEndian), 0x1234u);
}

TEST(ByteHelpersCodec, EncodeU16_DecodeU16_LittleEndian) {
  uint8_t buf[2];
  EncodeU16(0x1234, ByteOrder::LittleEndian, buf);
  EXPECT_EQ(buf[0], 0x34);
  EXPECT_EQ(buf[1], 0x12);
  EXPECT_EQ(DecodeU16(buf[0], buf[1], ByteOrder::LittleEndian), 0x1234u);
}

TEST(ByteHelpersCodec, CoilOnValueBigEndian) {
  uint8_t buf[2];
  EncodeU16(0xFF00, ByteOrder::BigEndian, buf);
  EXPECT_EQ(buf[0], 0xFF);
  EXPECT_EQ(buf[1], 0x00);
}
