#include "luci_servo_cpp/serial_log_reader.hpp"

#include "luci_servo_cpp/byte_utils.hpp"
#include "luci_servo_cpp/serial_port.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>

#include <poll.h>
#include <unistd.h>

#include "rclcpp/rclcpp.hpp"
#include <rover_common/string_utils.hpp>

using namespace std;


namespace luci_servo_cpp
{

LineAssembler::LineAssembler(size_t max_line_length)
: max_line_length_(max_line_length)
{
}

vector<string> LineAssembler::push(const uint8_t * data, size_t len)
{
  vector<string> out;
  for (size_t i = 0; i < len; ++i) {
    if (data[i] == '\n') {
      emit(out);
      continue;
    }
    pending_.push_back(data[i]);
    if (pending_.size() >= max_line_length_) {
      emit(out);
    }
  }
  return out;
}

vector<string> LineAssembler::push(const vector<uint8_t> & data)
{
  return push(data.data(), data.size());
}

vector<string> LineAssembler::flush()
{
  vector<string> out;
  emit(out);
  return out;
}

void LineAssembler::emit(vector<string> & out)
{
  const auto text = rover_common::trim(utf8_sanitize(pending_));
  pending_.clear();
  if (!text.empty()) {
    out.push_back(text);
  }
}

SerialLogReader::SerialLogReader(const string & device, int baudrate, int poll_interval_ms)
: device_(device), baudrate_(baudrate), poll_interval_ms_(poll_interval_ms)
{
}

SerialLogReader::~SerialLogReader()
{
  stop();
}

void SerialLogReader::set_callback(LineCallback cb)
{
  lock_guard<mutex> lk(cb_mutex_);
  callback_ = move(cb);
}

bool SerialLogReader::start()
{
  if (running_) {
    return true;
  }
  // 이전 리더 스레드가 포트 끊김으로 종료된 경우
  stop();

  {
    lock_guard<mutex> lk(port_mutex_);
    string error;
    fd_ = open_serial_port(device_, baudrate_, poll_interval_ms_ / 1000.0, error);
    if (fd_ < 0) {
      last_error_ = error;
      RCLCPP_ERROR(rclcpp::get_logger("luci_servo_cpp.log_reader"), "%s", error.c_str());
      return false;
    }
  }

  running_ = true;
  read_thread_ = thread(&SerialLogReader::read_task, this);
  RCLCPP_INFO(
    rclcpp::get_logger("luci_servo_cpp.log_reader"), "reading logs from %s @ %d",
    device_.c_str(), baudrate_);
  return true;
}

void SerialLogReader::stop()
{
  running_ = false;
  if (read_thread_.joinable()) {
    read_thread_.join();
  }
  deliver(assembler_.flush());

  lock_guard<mutex> lk(port_mutex_);
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

bool SerialLogReader::is_running() const
{
  return running_;
}

string SerialLogReader::last_error() const
{
  lock_guard<mutex> lk(port_mutex_);
  return last_error_;
}

bool SerialLogReader::send_line(const string & command)
{
  string line = command;
  if (line.empty() || line.back() != '\n') {
    line.push_back('\n');
  }
  return write_bytes(vector<uint8_t>(line.begin(), line.end()));
}

bool SerialLogReader::send_interrupt()
{
  return write_bytes({0x03});
}

bool SerialLogReader::write_bytes(const vector<uint8_t> & data)
{
  lock_guard<mutex> lk(port_mutex_);
  if (fd_ < 0) {
    last_error_ = "not connected";
    return false;
  }
  size_t written = 0;
  while (written < data.size()) {
    const auto n = ::write(fd_, data.data() + written, data.size() - written);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      last_error_ = string("write: ") + strerror(errno);
      return false;
    }
    written += static_cast<size_t>(n);
  }
  return true;
}

void SerialLogReader::deliver(const vector<string> & lines)
{
  if (lines.empty()) {
    return;
  }
  lock_guard<mutex> lk(cb_mutex_);
  if (!callback_) {
    return;
  }
  for (const auto & line : lines) {
    callback_(line);
  }
}

void SerialLogReader::read_task()
{
  static constexpr size_t kBufSize = 256;
  uint8_t buf[kBufSize];

  while (running_) {
    int fd = -1;
    {
      lock_guard<mutex> lk(port_mutex_);
      fd = fd_;
    }
    if (fd < 0) {
      break;
    }

    // 포트 잠금 없이 대기해야 send_line 이 막히지 않는다
    pollfd pfd{fd, POLLIN, 0};
    const int rc = poll(&pfd, 1, poll_interval_ms_);
    if (rc == 0) {
      continue;
    }
    if (rc < 0) {
      if (errno == EINTR) {
        continue;
      }
      RCLCPP_ERROR(
        rclcpp::get_logger("luci_servo_cpp.log_reader"), "poll error: %s", strerror(errno));
      this_thread::sleep_for(chrono::milliseconds(100));
      continue;
    }
    if ((pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) != 0) {
      RCLCPP_ERROR(
        rclcpp::get_logger("luci_servo_cpp.log_reader"), "%s disconnected", device_.c_str());
      break;
    }

    const auto n = ::read(fd, buf, kBufSize);
    if (n < 0) {
      if (errno == EINTR || errno == EAGAIN) {
        continue;
      }
      RCLCPP_ERROR(
        rclcpp::get_logger("luci_servo_cpp.log_reader"), "read error: %s", strerror(errno));
      this_thread::sleep_for(chrono::milliseconds(100));
      continue;
    }
    if (n == 0) {
      continue;
    }
    deliver(assembler_.push(buf, static_cast<size_t>(n)));
  }
  running_ = false;
}

}  // namespace luci_servo_cpp
