#include "luci_servo_cpp/transport.hpp"

#include "luci_servo_cpp/byte_utils.hpp"
#include "luci_servo_cpp/serial_transport.hpp"
#include "luci_servo_cpp/tcp_transport.hpp"

#include <algorithm>
#include <stdexcept>
#include <thread>

#include "rclcpp/rclcpp.hpp"
#include <rover_common/string_utils.hpp>

using namespace std;


namespace luci_servo_cpp
{

bool parse_preamble_encoding(const string & name, PreambleEncoding & out)
{
  const auto key = rover_common::to_lower(rover_common::trim(name));
  if (key == "text") {
    out = PreambleEncoding::TEXT;
  } else if (key == "raw") {
    out = PreambleEncoding::RAW;
  } else {
    return false;
  }
  return true;
}

bool parse_transport_kind(const string & name, string & out)
{
  const auto key = rover_common::to_lower(rover_common::trim(name));
  if (key == "serial" || key == "usb") {
    out = "serial";
  } else if (key == "tcp") {
    out = "tcp";
  } else {
    return false;
  }
  return true;
}

Transport::Transport(int inter_command_delay_ms, bool log_replies)
: inter_command_delay_(max(0, inter_command_delay_ms)), log_replies_(log_replies)
{
}

CommandResult Transport::send(const vector<uint8_t> & packet)
{
  if (!is_open()) {
    return CommandResult::failure(ErrorCode::NOT_CONNECTED, "not connected");
  }

  const auto now = chrono::steady_clock::now();
  if (now < next_send_time_) {
    this_thread::sleep_until(next_send_time_);
  }

  const auto result = write_all(packet);
  next_send_time_ = chrono::steady_clock::now() + inter_command_delay_;
  if (!result.ok) {
    RCLCPP_ERROR(
      rclcpp::get_logger("luci_servo_cpp.transport"), "%s: write failed: %s",
      describe().c_str(), result.error.c_str());
    return result;
  }

  const auto reply = drain_reply();
  if (!reply.empty()) {
    if (log_replies_) {
      RCLCPP_INFO(
        rclcpp::get_logger("luci_servo_cpp.transport"), "%s reply (%zu bytes): %s",
        describe().c_str(), reply.size(), to_hex(reply).c_str());
    } else {
      RCLCPP_DEBUG(
        rclcpp::get_logger("luci_servo_cpp.transport"), "%s discarded %zu reply bytes",
        describe().c_str(), reply.size());
    }
  }
  return result;
}

void Transport::hold_until(chrono::steady_clock::time_point t)
{
  next_send_time_ = max(next_send_time_, t);
}

void Transport::reset_pacing()
{
  next_send_time_ = chrono::steady_clock::time_point{};
}

unique_ptr<Transport> make_transport(const TransportConfig & config)
{
  string kind;
  if (!parse_transport_kind(config.kind, kind)) {
    throw invalid_argument("unknown transport kind: " + config.kind);
  }
  if (kind == "serial") {
    return unique_ptr<Transport>(new SerialTransport(
               config.device, config.serial_baudrate, config.serial_settle_ms,
               config.inter_command_delay_ms, config.log_replies));
  }
  return unique_ptr<Transport>(new TcpTransport(config));
}

}  // namespace luci_servo_cpp
