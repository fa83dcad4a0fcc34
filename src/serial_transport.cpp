#include "luci_servo_cpp/serial_transport.hpp"

#include "luci_servo_cpp/serial_port.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>

#include <poll.h>
#include <termios.h>
#include <unistd.h>

#include "rclcpp/rclcpp.hpp"

using namespace std;


namespace luci_servo_cpp
{

SerialTransport::SerialTransport(
  const string & device, int baudrate, int settle_ms, int inter_command_delay_ms,
  bool log_replies)
: Transport(inter_command_delay_ms, log_replies),
  device_(device),
  baudrate_(baudrate),
  settle_ms_(settle_ms)
{
}

SerialTransport::~SerialTransport()
{
  close();
}

CommandResult SerialTransport::open()
{
  close();

  string error;
  fd_ = open_serial_port(device_, baudrate_, 0.1, error);
  if (fd_ < 0) {
    RCLCPP_ERROR(rclcpp::get_logger("luci_servo_cpp.serial"), "%s", error.c_str());
    return CommandResult::failure(ErrorCode::CONNECT_REFUSED, error);
  }

  // 포트 초기화 직후 안정화 시간 동안 첫 명령을 보류
  reset_pacing();
  hold_until(chrono::steady_clock::now() + chrono::milliseconds(settle_ms_));

  RCLCPP_INFO(rclcpp::get_logger("luci_servo_cpp.serial"), "serial: %s @ %d", device_.c_str(), baudrate_);
  return CommandResult::success();
}

void SerialTransport::close()
{
  if (fd_ >= 0) {
    tcdrain(fd_);
    tcflush(fd_, TCIOFLUSH);
    ::close(fd_);
    fd_ = -1;
  }
}

bool SerialTransport::is_open() const
{
  return fd_ >= 0;
}

string SerialTransport::describe() const
{
  return device_ + "@" + to_string(baudrate_);
}

CommandResult SerialTransport::write_all(const vector<uint8_t> & data)
{
  size_t written = 0;
  while (written < data.size()) {
    const auto n = ::write(fd_, data.data() + written, data.size() - written);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      return CommandResult::failure(ErrorCode::IO_ERROR, string("write: ") + strerror(errno));
    }
    written += static_cast<size_t>(n);
  }
  if (tcdrain(fd_) != 0) {
    return CommandResult::failure(ErrorCode::IO_ERROR, string("tcdrain: ") + strerror(errno));
  }
  return CommandResult::success();
}

vector<uint8_t> SerialTransport::drain_reply()
{
  vector<uint8_t> out;
  uint8_t buf[256];
  while (true) {
    pollfd pfd{fd_, POLLIN, 0};
    if (poll(&pfd, 1, 0) <= 0 || (pfd.revents & POLLIN) == 0) {
      break;
    }
    const auto n = ::read(fd_, buf, sizeof(buf));
    if (n <= 0) {
      break;
    }
    out.insert(out.end(), buf, buf + n);
  }
  return out;
}

}  // namespace luci_servo_cpp
