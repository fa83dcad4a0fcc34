#include <gtest/gtest.h>

#include <vector>

#include "luci_servo_cpp/byte_utils.hpp"
#include "luci_servo_cpp/dynamixel_packet.hpp"
#include "luci_servo_cpp/luci_packet.hpp"

using namespace luci_servo_cpp;

namespace
{

const std::vector<uint8_t> kFrame{0xFF, 0xFF, 0x01, 0x04, 0x03, 0x04, 0x08, 0xEB};

}  // namespace

TEST(LuciPacket, BaudRateIndex)
{
  EXPECT_EQ(baud_rate_index(2000000), 0);
  EXPECT_EQ(baud_rate_index(1000000), 1);
  EXPECT_EQ(baud_rate_index(222222), 3);
  EXPECT_EQ(baud_rate_index(57142), 6);
  EXPECT_EQ(baud_rate_index(9615), 7);
}

TEST(LuciPacket, UnknownBaudRateFallsBack)
{
  EXPECT_EQ(baud_rate_index(4000000), 6);
  EXPECT_EQ(baud_rate_index(57600), 6);
  EXPECT_FALSE(is_supported_baud_rate(4000000));
  EXPECT_TRUE(is_supported_baud_rate(117647));
}

TEST(LuciPacket, DirectEnvelopeLayout)
{
  const auto env = wrap(254, 0, kFrame);
  const std::vector<uint8_t> header{
    0x00, 0x00, 0x02, 0xFE, 0x00, 0x00, 0x00, 0x00,
    13, 0x00,
    0x00,
    8, 0x00,
    0x00, 0x00};
  ASSERT_EQ(env.size(), header.size() + kFrame.size());
  EXPECT_EQ(std::vector<uint8_t>(env.begin(), env.begin() + 15), header);
  EXPECT_EQ(std::vector<uint8_t>(env.begin() + 15, env.end()), kFrame);
}

TEST(LuciPacket, UartBridgeCarriesPortAndBaudIndex)
{
  UartHeader uart;
  uart.baud_index = 3;
  const auto env = wrap(254, 0, kFrame, uart);

  ASSERT_EQ(env.size(), 15 + 2 + kFrame.size());
  EXPECT_EQ(static_cast<size_t>(read_u16(env, 8)), kFrame.size() + 2 + 5);
  EXPECT_EQ(static_cast<size_t>(read_u16(env, 11)), kFrame.size() + 2);
  EXPECT_EQ(env[15], 0);
  EXPECT_EQ(env[16], 3);
  EXPECT_EQ(std::vector<uint8_t>(env.begin() + 17, env.end()), kFrame);
}

TEST(LuciPacket, TotalLengthInvariant)
{
  for (size_t n = 1; n <= 200; n += 7) {
    const std::vector<uint8_t> frame(n, 0xAB);
    for (const bool with_uart : {false, true}) {
      const auto env = with_uart ? wrap(7, 0, frame, UartHeader()) : wrap(7, 0, frame);
      const auto sub0_len = read_u16(env, 11);
      EXPECT_EQ(read_u16(env, 8), sub0_len + 5);
      EXPECT_EQ(env.size(), 15u + sub0_len);
      EXPECT_EQ(read_u16(env, 3), 7);
    }
  }
}

TEST(LuciPacket, ShortFormModes)
{
  const std::vector<uint8_t> prefix{0x00, 0x00, 0x02};
  EXPECT_EQ(wrap(254, 4, kFrame), prefix);
  EXPECT_EQ(wrap(254, 5, kFrame, UartHeader()), prefix);
  EXPECT_TRUE(is_short_form_mode(4));
  EXPECT_FALSE(is_short_form_mode(0));

  EnvelopeConfig config;
  config.mode = 5;
  config.layout = EnvelopeLayout::GENERAL;
  EXPECT_EQ(wrap_envelope(config, kFrame), prefix);
}

TEST(LuciPacket, GeneralLayout)
{
  const auto env = wrap_general(254, kFrame);
  const std::vector<uint8_t> header{0x00, 0x00, 0x02, 0xFE, 0x00, 0x00, 0x00, 0x00, 8, 0x00};
  ASSERT_EQ(env.size(), 10 + kFrame.size());
  EXPECT_EQ(std::vector<uint8_t>(env.begin(), env.begin() + 10), header);
  EXPECT_EQ(std::vector<uint8_t>(env.begin() + 10, env.end()), kFrame);
}

TEST(LuciPacket, WrapEnvelopeSelectsLayout)
{
  EnvelopeConfig config;
  config.bus_baudrate = 4000000;
  const auto bridge = wrap_envelope(config, kFrame);
  EXPECT_EQ(bridge[15], 0);
  EXPECT_EQ(bridge[16], 6);

  config.layout = EnvelopeLayout::DIRECT;
  EXPECT_EQ(wrap_envelope(config, kFrame), wrap(254, 0, kFrame));

  config.layout = EnvelopeLayout::GENERAL;
  EXPECT_EQ(wrap_envelope(config, kFrame), wrap_general(254, kFrame));
}

TEST(LuciPacket, ParseEnvelopeLayout)
{
  EnvelopeLayout layout = EnvelopeLayout::DIRECT;
  EXPECT_TRUE(parse_envelope_layout("UART_BRIDGE", layout));
  EXPECT_EQ(layout, EnvelopeLayout::UART_BRIDGE);
  EXPECT_TRUE(parse_envelope_layout(" ls5 ", layout));
  EXPECT_EQ(layout, EnvelopeLayout::GENERAL);
  EXPECT_FALSE(parse_envelope_layout("bogus", layout));
  EXPECT_EQ(layout, EnvelopeLayout::GENERAL);
}
