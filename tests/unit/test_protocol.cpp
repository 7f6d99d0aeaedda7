#include <gtest/gtest.h>

#include <cstdint>
#include <stdexcept>
#include <vector>

#include "crc16.hpp"
#include "glider_error.hpp"
#include "protocol.hpp"

// ═══════════════════════════════════════════════════════════════════════════
// Mode table
// ═══════════════════════════════════════════════════════════════════════════

TEST(ModeTest, WireCodesMatchFirmware) {
  EXPECT_EQ(mode_code(Mode::ManualLUTNoDither), 0);
  EXPECT_EQ(mode_code(Mode::ManualLUTErrorDiffusion), 1);
  EXPECT_EQ(mode_code(Mode::FastMonoNoDither), 2);
  EXPECT_EQ(mode_code(Mode::FastMonoBayer), 3);
  EXPECT_EQ(mode_code(Mode::FastMonoBlueNoise), 4);
  EXPECT_EQ(mode_code(Mode::FastGrey), 5);
  EXPECT_EQ(mode_code(Mode::AutoNoDither), 6);
  EXPECT_EQ(mode_code(Mode::AutoErrorDiffusion), 7);
}

TEST(ModeTest, AllModesInCodeOrder) {
  const auto& modes = all_modes();
  ASSERT_EQ(modes.size(), 8u);
  for (size_t i = 0; i < modes.size(); i++) {
    EXPECT_EQ(mode_code(modes[i]), static_cast<int16_t>(i));
    EXPECT_EQ(mode_from_code(static_cast<int16_t>(i)), modes[i]);
  }
}

TEST(ModeTest, ParseByNameOrCode) {
  EXPECT_EQ(parse_mode("FastMonoBayer"), Mode::FastMonoBayer);
  EXPECT_EQ(parse_mode("autoerrordiffusion"), Mode::AutoErrorDiffusion);
  EXPECT_EQ(parse_mode("5"), Mode::FastGrey);
  EXPECT_STREQ(mode_name(parse_mode("0")), "ManualLUTNoDither");
}

TEST(ModeTest, ParseRejectsUnknown) {
  EXPECT_THROW(parse_mode("Sepia"), std::invalid_argument);
  EXPECT_THROW(parse_mode("8"), std::invalid_argument);
  EXPECT_THROW(parse_mode(""), std::invalid_argument);
  EXPECT_THROW(mode_from_code(-1), std::invalid_argument);
}

// ═══════════════════════════════════════════════════════════════════════════
// Frame encoding
// ═══════════════════════════════════════════════════════════════════════════

TEST(FrameTest, SetModeBlueNoiseFullScreen) {
  Frame frame = build_set_mode_frame(Mode::FastMonoBlueNoise, {0, 0, 1000, 1000});

  const std::vector<uint8_t> expected = {
      0x00, 0x05,              // USBCMD_SETMODE, big-endian
      0x00, 0x04,              // FastMonoBlueNoise, big-endian
      0x00,                    // padding
      0x00, 0x00, 0x00, 0x00,  // x0, y0
      0xE8, 0x03, 0xE8, 0x03,  // x1, y1 little-endian
      0x52, 0x95,              // CRC-16/XMODEM big-endian
  };
  EXPECT_EQ(std::vector<uint8_t>(frame.begin(), frame.end()), expected);
}

TEST(FrameTest, RedrawAlwaysSendsZeroParam) {
  for (const Rect& area : {Rect{10, 20, 30, 40}, Rect{-1, -1, -1, -1},
                           Rect{32767, 32767, -32768, -32768}}) {
    Frame frame = build_redraw_frame(area);
    EXPECT_EQ(frame[0], 0x00);
    EXPECT_EQ(frame[1], 0x04);
    EXPECT_EQ(frame[2], 0x00) << "param must stay zero";
    EXPECT_EQ(frame[3], 0x00) << "param must stay zero";
    EXPECT_EQ(frame[4], FRAME_PADDING);
  }
}

TEST(FrameTest, RedrawKnownChecksum) {
  Frame frame = build_redraw_frame({10, 20, 30, 40});
  EXPECT_EQ(frame[5], 0x0A);
  EXPECT_EQ(frame[7], 0x14);
  EXPECT_EQ(frame[9], 0x1E);
  EXPECT_EQ(frame[11], 0x28);
  EXPECT_EQ(frame[13], 0xB6);
  EXPECT_EQ(frame[14], 0x3F);
}

TEST(FrameTest, MixedEndianness) {
  Frame frame = encode_frame(0x1234, static_cast<int16_t>(0xABCD),
                             {0x0102, static_cast<int16_t>(0xFFFE), 0x7F00, -32768});
  EXPECT_EQ(frame.size(), FRAME_SIZE);
  // header big-endian
  EXPECT_EQ(frame[0], 0x12);
  EXPECT_EQ(frame[1], 0x34);
  EXPECT_EQ(frame[2], 0xAB);
  EXPECT_EQ(frame[3], 0xCD);
  // rect little-endian
  EXPECT_EQ(frame[5], 0x02);
  EXPECT_EQ(frame[6], 0x01);
  EXPECT_EQ(frame[7], 0xFE);
  EXPECT_EQ(frame[8], 0xFF);
  EXPECT_EQ(frame[9], 0x00);
  EXPECT_EQ(frame[10], 0x7F);
  EXPECT_EQ(frame[11], 0x00);
  EXPECT_EQ(frame[12], 0x80);
}

TEST(FrameTest, ChecksumCoversFirstThirteenBytes) {
  Frame frame = build_set_mode_frame(Mode::AutoNoDither, {800, 0, 1600, 600});
  uint16_t crc = crc16_xmodem(frame.data(), FRAME_PAYLOAD_SIZE);
  EXPECT_EQ(frame[13], crc >> 8);
  EXPECT_EQ(frame[14], crc & 0xFF);
}

TEST(FrameTest, EncodingIsDeterministic) {
  Rect area{800, 600, 1600, 1200};
  EXPECT_EQ(build_set_mode_frame(Mode::FastMonoBayer, area),
            build_set_mode_frame(Mode::FastMonoBayer, area));
  EXPECT_EQ(build_redraw_frame(area), build_redraw_frame(area));
}

// ═══════════════════════════════════════════════════════════════════════════
// Response decoding
// ═══════════════════════════════════════════════════════════════════════════

TEST(StatusTest, InvalidCommand) {
  EXPECT_EQ(decode_status(std::vector<uint8_t>{0x00, 0x00}), Outcome::InvalidCommand);
}

TEST(StatusTest, ChecksumMismatch) {
  EXPECT_EQ(decode_status(std::vector<uint8_t>{0x01, 0x00}), Outcome::ChecksumMismatch);
}

TEST(StatusTest, AnythingElseIsSuccess) {
  // 0x5500 little-endian
  EXPECT_EQ(decode_status(std::vector<uint8_t>{0x00, 0x55}), Outcome::Success);
  EXPECT_EQ(decode_status(std::vector<uint8_t>{0x55, 0x00}), Outcome::Success);
  EXPECT_EQ(decode_status(std::vector<uint8_t>{0x00, 0x01}), Outcome::Success);
  EXPECT_EQ(decode_status(std::vector<uint8_t>{0xFF, 0xFF}), Outcome::Success);
}

TEST(StatusTest, TrailingBytesIgnored) {
  std::vector<uint8_t> response(32, 0xAA);
  response[0] = 0x01;
  response[1] = 0x00;
  EXPECT_EQ(decode_status(response), Outcome::ChecksumMismatch);
}

TEST(StatusTest, ShortResponseIsProtocolViolation) {
  EXPECT_THROW(decode_status(std::vector<uint8_t>{}), ProtocolViolationError);
  EXPECT_THROW(decode_status(std::vector<uint8_t>{0x55}), ProtocolViolationError);
}

TEST(StatusTest, StatusWordIsLittleEndian) {
  const uint8_t bytes[] = {0x34, 0x12};
  EXPECT_EQ(read_status_word(bytes, sizeof(bytes)), 0x1234);
}

TEST(FormatHexTest, SpaceSeparated) {
  const uint8_t bytes[] = {0x00, 0x05, 0xE8};
  EXPECT_EQ(format_hex(bytes, sizeof(bytes)), "00 05 e8");
  EXPECT_EQ(format_hex(bytes, 0), "");
}
