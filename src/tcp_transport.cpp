#include "luci_servo_cpp/tcp_transport.hpp"

#include "luci_servo_cpp/byte_utils.hpp"

#include <cerrno>
#include <cstring>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include "rclcpp/rclcpp.hpp"

using namespace std;


namespace luci_servo_cpp
{

vector<uint8_t> encode_preamble(PreambleEncoding encoding)
{
  const vector<uint8_t> raw(luci::kRegisterPreamble.begin(), luci::kRegisterPreamble.end());
  if (encoding == PreambleEncoding::RAW) {
    return raw;
  }
  const auto text = utf8_sanitize(raw);
  return vector<uint8_t>(text.begin(), text.end());
}

TcpTransport::TcpTransport(const TransportConfig & config)
: Transport(config.inter_command_delay_ms, config.log_replies),
  host_(config.host),
  port_(config.port),
  connect_timeout_ms_(config.connect_timeout_ms),
  reply_timeout_ms_(config.reply_timeout_ms),
  preamble_encoding_(config.preamble_encoding)
{
}

TcpTransport::~TcpTransport()
{
  close();
}

CommandResult TcpTransport::open()
{
  close();

  auto result = connect_socket();
  if (!result.ok) {
    RCLCPP_ERROR(
      rclcpp::get_logger("luci_servo_cpp.tcp"), "connect %s failed: %s",
      describe().c_str(), result.error.c_str());
    close();
    return result;
  }

  // 명령 패킷보다 먼저 등록 preamble 1회 전송
  result = write_all(encode_preamble(preamble_encoding_));
  if (!result.ok) {
    RCLCPP_ERROR(
      rclcpp::get_logger("luci_servo_cpp.tcp"), "registration to %s failed: %s",
      describe().c_str(), result.error.c_str());
    close();
    return result;
  }

  read_registration_reply();
  reset_pacing();

  RCLCPP_INFO(rclcpp::get_logger("luci_servo_cpp.tcp"), "connected to %s", describe().c_str());
  return CommandResult::success();
}

CommandResult TcpTransport::connect_socket()
{
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(static_cast<uint16_t>(port_));
  if (inet_pton(AF_INET, host_.c_str(), &addr.sin_addr) != 1) {
    return CommandResult::failure(ErrorCode::CONNECT_REFUSED, "invalid host IP address: " + host_);
  }

  socket_fd_ = socket(AF_INET, SOCK_STREAM, 0);
  if (socket_fd_ < 0) {
    return CommandResult::failure(ErrorCode::CONNECT_REFUSED, string("socket: ") + strerror(errno));
  }

  const int flags = fcntl(socket_fd_, F_GETFL, 0);
  fcntl(socket_fd_, F_SETFL, flags | O_NONBLOCK);

  if (::connect(socket_fd_, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0) {
    if (errno != EINPROGRESS) {
      const int err = errno;
      return CommandResult::failure(
        err == ETIMEDOUT ? ErrorCode::CONNECT_TIMEOUT : ErrorCode::CONNECT_REFUSED, strerror(err));
    }

    pollfd pfd{socket_fd_, POLLOUT, 0};
    int rc = 0;
    do {
      rc = poll(&pfd, 1, connect_timeout_ms_);
    } while (rc < 0 && errno == EINTR);
    if (rc == 0) {
      return CommandResult::failure(
        ErrorCode::CONNECT_TIMEOUT,
        "no answer within " + to_string(connect_timeout_ms_) + " ms");
    }
    if (rc < 0) {
      return CommandResult::failure(ErrorCode::CONNECT_REFUSED, string("poll: ") + strerror(errno));
    }

    int so_error = 0;
    socklen_t len = sizeof(so_error);
    getsockopt(socket_fd_, SOL_SOCKET, SO_ERROR, &so_error, &len);
    if (so_error != 0) {
      return CommandResult::failure(
        so_error == ETIMEDOUT ? ErrorCode::CONNECT_TIMEOUT : ErrorCode::CONNECT_REFUSED,
        strerror(so_error));
    }
  }

  // blocking 으로 되돌리고 쓰기에도 timeout 을 건다
  fcntl(socket_fd_, F_SETFL, flags & ~O_NONBLOCK);
  timeval tv{};
  tv.tv_sec = connect_timeout_ms_ / 1000;
  tv.tv_usec = (connect_timeout_ms_ % 1000) * 1000;
  setsockopt(socket_fd_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
  const int one = 1;
  setsockopt(socket_fd_, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
  return CommandResult::success();
}

void TcpTransport::read_registration_reply()
{
  // 게이트웨이가 응답하지 않을 수도 있으므로 응답 부재는 오류가 아니다
  pollfd pfd{socket_fd_, POLLIN, 0};
  if (poll(&pfd, 1, reply_timeout_ms_) <= 0 || (pfd.revents & POLLIN) == 0) {
    RCLCPP_DEBUG(rclcpp::get_logger("luci_servo_cpp.tcp"), "no registration reply");
    return;
  }

  uint8_t buf[1024];
  const auto n = recv(socket_fd_, buf, sizeof(buf), MSG_DONTWAIT);
  if (n > 0) {
    RCLCPP_DEBUG(
      rclcpp::get_logger("luci_servo_cpp.tcp"), "registration reply: %s",
      to_hex(vector<uint8_t>(buf, buf + n)).c_str());
  }
}

void TcpTransport::close()
{
  if (socket_fd_ >= 0) {
    ::close(socket_fd_);
    socket_fd_ = -1;
  }
}

bool TcpTransport::is_open() const
{
  return socket_fd_ >= 0;
}

string TcpTransport::describe() const
{
  return host_ + ":" + to_string(port_);
}

CommandResult TcpTransport::write_all(const vector<uint8_t> & data)
{
  size_t sent = 0;
  while (sent < data.size()) {
    const auto n = ::send(socket_fd_, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      return CommandResult::failure(ErrorCode::IO_ERROR, string("send: ") + strerror(errno));
    }
    sent += static_cast<size_t>(n);
  }
  return CommandResult::success();
}

vector<uint8_t> TcpTransport::drain_reply()
{
  vector<uint8_t> out;
  uint8_t buf[1024];
  while (true) {
    const auto n = recv(socket_fd_, buf, sizeof(buf), MSG_DONTWAIT);
    if (n > 0) {
      out.insert(out.end(), buf, buf + n);
      continue;
    }
    if (n == 0) {
      RCLCPP_WARN(rclcpp::get_logger("luci_servo_cpp.tcp"), "%s closed by peer", describe().c_str());
    }
    break;
  }
  return out;
}

}  // namespace luci_servo_cpp
