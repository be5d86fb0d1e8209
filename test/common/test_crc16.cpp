#include <gtest/gtest.h>
#include <vector>
#include "fpss_modbus/common/byte_helpers.hpp"
#include "fpss_modbus/common/crc16.hpp"

using fpssmb::CalculateCrc16;
using fpssmb::GetHighByte;
using fpssmb::GetLowByte;
using fpssmb::ReadFrameCrc;
using fpssmb::VerifyCrc16;

TEST(CRC16, EmptyData) {
  std::vector<uint8_t> empty;
  uint16_t crc = CalculateCrc16(empty);
  // CRC of empty data should be initial value (0xFFFF)
  EXPECT_EQ(crc, 0xFFFF);
}

TEST(CRC16, SingleByte) {
  std::vector<uint8_t> data{0x01};
  uint16_t crc = CalculateCrc16(data);
  EXPECT_NE(crc, 0xFFFF);
}

TEST(CRC16, Deterministic) {
  std::vector<uint8_t> data{0x07, 0x03, 0x12, 0x34, 0x00, 0x7D};
  EXPECT_EQ(CalculateCrc16(data), CalculateCrc16(data));
}

TEST(CRC16, ModbusSerialLineReadExample) {
  // MODBUS over Serial Line V1.02, read holding registers example: 11 03 00 6B 00 03 | 76 87
  std::vector<uint8_t> frame{0x11, 0x03, 0x00, 0x6B, 0x00, 0x03};
  uint16_t crc = CalculateCrc16(frame);
  EXPECT_EQ(GetLowByte(crc), 0x76);
  EXPECT_EQ(GetHighByte(crc), 0x87);

  frame.push_back(0x76);
  frame.push_back(0x87);
  EXPECT_TRUE(VerifyCrc16(frame));
}

TEST(CRC16, ModbusWriteMultipleExample) {
  // Write multiple registers example from the application protocol: 11 10 00 01 00 02 04 00 0A 01 02 | C6 F0
  std::vector<uint8_t> frame{0x11, 0x10, 0x00, 0x01, 0x00, 0x02, 0x04, 0x00, 0x0A, 0x01, 0x02};
  uint16_t crc = CalculateCrc16(frame);
  EXPECT_EQ(GetLowByte(crc), 0xC6);
  EXPECT_EQ(GetHighByte(crc), 0xF0);
}

TEST(CRC16, ReadOneRegisterVector) {
  // 01 03 00 00 00 01 | 84 0A
  std::vector<uint8_t> frame{0x01, 0x03, 0x00, 0x00, 0x00, 0x01};
  EXPECT_EQ(CalculateCrc16(frame), 0x0A84);
}

TEST(CRC16, ReadTenRegistersVector) {
  // 01 03 00 00 00 0A | C5 CD
  std::vector<uint8_t> frame{0x01, 0x03, 0x00, 0x00, 0x00, 0x0A};
  EXPECT_EQ(CalculateCrc16(frame), 0xCDC5);
}

TEST(CRC16, ExceptionResponseVector) {
  // 01 83 02 | C0 F1
  std::vector<uint8_t> frame{0x01, 0x83, 0x02, 0xC0, 0xF1};
  EXPECT_TRUE(VerifyCrc16(frame));
}

TEST(CRC16, ReadFrameCrcIsLowByteFirst) {
  std::vector<uint8_t> frame{0xAA, 0x34, 0x12};
  EXPECT_EQ(ReadFrameCrc(frame), 0x1234);
}

TEST(CRC16, VerifyValidFrame) {
  std::vector<uint8_t> frame{0x01, 0x03, 0x00, 0x00, 0x00, 0x0A};
  uint16_t crc = CalculateCrc16(frame);
  frame.push_back(GetLowByte(crc));
  frame.push_back(GetHighByte(crc));

  EXPECT_TRUE(VerifyCrc16(frame));
}

TEST(CRC16, VerifyInvalidFrameTooShort) {
  std::vector<uint8_t> frame{0x01};  // Too short (need at least 2 bytes for CRC)
  EXPECT_FALSE(VerifyCrc16(frame));
}

TEST(CRC16, VerifyCrcOnlyFrame) {
  // No data: the CRC of nothing is 0xFFFF
  std::vector<uint8_t> frame{0xFF, 0xFF};
  EXPECT_TRUE(VerifyCrc16(frame));
}

TEST(CRC16, VerifyInvalidFrameCorruptedData) {
  std::vector<uint8_t> frame{0x01, 0x03, 0x00, 0x00, 0x00, 0x0A};
  uint16_t crc = CalculateCrc16(frame);
  frame.push_back(GetLowByte(crc));
  frame.push_back(GetHighByte(crc));

  // Corrupt the data
  frame[0] = 0x02;
  EXPECT_FALSE(VerifyCrc16(frame));
}

TEST(CRC16, VerifyInvalidFrameSwappedCrcBytes) {
  std::vector<uint8_t> frame{0x01, 0x03, 0x00, 0x00, 0x00, 0x0A};
  uint16_t crc = CalculateCrc16(frame);
  frame.push_back(GetHighByte(crc));
  frame.push_back(GetLowByte(crc));

  EXPECT_FALSE(VerifyCrc16(frame));
}

TEST(CRC16, EverySingleBitFlipDetected) {
  std::vector<uint8_t> frame{0x01, 0x10, 0x00, 0x01, 0x00, 0x02, 0x04, 0x00, 0x0A, 0x01, 0x02};
  uint16_t crc = CalculateCrc16(frame);
  frame.push_back(GetLowByte(crc));
  frame.push_back(GetHighByte(crc));

  for (size_t i = 0; i < frame.size(); ++i) {
    for (int bit = 0; bit < 8; ++bit) {
      auto corrupted = frame;
      corrupted[i] ^= static_cast<uint8_t>(1U << bit);
      EXPECT_FALSE(VerifyCrc16(corrupted)) << "byte " << i << " bit " << bit;
    }
  }
}
