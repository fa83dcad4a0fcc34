#include "luci_servo_cpp/luci_packet.hpp"

#include "luci_servo_cpp/byte_utils.hpp"

#include <stdexcept>

#include "rclcpp/rclcpp.hpp"
#include <rover_common/string_utils.hpp>

using namespace std;


namespace luci_servo_cpp
{

namespace
{

void append_prefix(vector<uint8_t> & out, uint16_t module_number)
{
  out.insert(out.end(), luci::kPrefix.begin(), luci::kPrefix.end());
  append_u16(out, module_number);
  out.push_back(0);
  out.push_back(0);
  out.push_back(0);
}

vector<uint8_t> short_form()
{
  return vector<uint8_t>(luci::kPrefix.begin(), luci::kPrefix.end());
}

}  // namespace

const char * envelope_layout_name(EnvelopeLayout layout)
{
  switch (layout) {
    case EnvelopeLayout::UART_BRIDGE: return "uart_bridge";
    case EnvelopeLayout::DIRECT: return "direct";
    case EnvelopeLayout::GENERAL: return "general";
    default: return "unknown";
  }
}

bool parse_envelope_layout(const string & name, EnvelopeLayout & out)
{
  const auto key = rover_common::to_lower(rover_common::trim(name));
  if (key == "uart_bridge" || key == "uart") {
    out = EnvelopeLayout::UART_BRIDGE;
  } else if (key == "direct") {
    out = EnvelopeLayout::DIRECT;
  } else if (key == "general" || key == "ls5") {
    out = EnvelopeLayout::GENERAL;
  } else {
    return false;
  }
  return true;
}

bool is_supported_baud_rate(uint32_t baud_rate)
{
  for (const auto b : luci::kBaudRates) {
    if (b == baud_rate) {
      return true;
    }
  }
  return false;
}

uint8_t baud_rate_index(uint32_t baud_rate)
{
  for (size_t i = 0; i < luci::kBaudRates.size(); ++i) {
    if (luci::kBaudRates[i] == baud_rate) {
      return static_cast<uint8_t>(i);
    }
  }
  // 기존 게이트웨이 동작: 알 수 없는 baud 는 오류가 아니라 57142 로 대체
  RCLCPP_WARN(
    rclcpp::get_logger("luci_servo_cpp.luci_packet"),
    "baud rate %u not in gateway table, using %u", baud_rate,
    luci::kBaudRates[luci::kFallbackBaudIndex]);
  return luci::kFallbackBaudIndex;
}

bool is_short_form_mode(uint8_t mode)
{
  return mode == luci::kModeShortA || mode == luci::kModeShortB;
}

vector<uint8_t> wrap(
  uint16_t module_number, uint8_t mode, const vector<uint8_t> & bus_frame,
  const optional<UartHeader> & uart)
{
  if (is_short_form_mode(mode)) {
    return short_form();
  }

  const size_t sub0_len = bus_frame.size() + (uart ? 2 : 0);
  if (sub0_len + 5 > 0xFFFF) {
    throw invalid_argument("luci payload too long: " + to_string(sub0_len));
  }

  vector<uint8_t> buf;
  buf.reserve(sub0_len + 15);
  append_prefix(buf, module_number);
  append_u16(buf, static_cast<uint16_t>(sub0_len + 5));
  buf.push_back(mode);
  append_u16(buf, static_cast<uint16_t>(sub0_len));
  append_u16(buf, 0);
  if (uart) {
    buf.push_back(uart->port);
    buf.push_back(uart->baud_index);
  }
  buf.insert(buf.end(), bus_frame.begin(), bus_frame.end());
  return buf;
}

vector<uint8_t> wrap_general(uint16_t module_number, const vector<uint8_t> & payload)
{
  if (payload.size() > 0xFFFF) {
    throw invalid_argument("luci payload too long: " + to_string(payload.size()));
  }

  vector<uint8_t> buf;
  buf.reserve(payload.size() + 10);
  append_prefix(buf, module_number);
  append_u16(buf, static_cast<uint16_t>(payload.size()));
  buf.insert(buf.end(), payload.begin(), payload.end());
  return buf;
}

vector<uint8_t> wrap_envelope(const EnvelopeConfig & config, const vector<uint8_t> & bus_frame)
{
  if (is_short_form_mode(config.mode)) {
    return short_form();
  }

  switch (config.layout) {
    case EnvelopeLayout::UART_BRIDGE: {
      UartHeader uart;
      uart.baud_index = baud_rate_index(config.bus_baudrate);
      return wrap(config.module_number, config.mode, bus_frame, uart);
    }
    case EnvelopeLayout::DIRECT:
      return wrap(config.module_number, config.mode, bus_frame);
    case EnvelopeLayout::GENERAL:
      return wrap_general(config.module_number, bus_frame);
    default:
      throw invalid_argument("unknown envelope layout");
  }
}

}  // namespace luci_servo_cpp
