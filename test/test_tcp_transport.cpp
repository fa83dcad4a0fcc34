#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <thread>
#include <vector>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include "luci_servo_cpp/servo_constants.hpp"
#include "luci_servo_cpp/tcp_transport.hpp"

using namespace luci_servo_cpp;

namespace
{

// 127.0.0.1 임의 포트에서 대기하는 테스트용 게이트웨이
class LoopbackGateway
{
public:
  explicit LoopbackGateway(int backlog = 1)
  {
    listen_fd_ = socket(AF_INET, SOCK_STREAM, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    bind(listen_fd_, reinterpret_cast<sockaddr *>(&addr), sizeof(addr));
    listen(listen_fd_, backlog);
    socklen_t len = sizeof(addr);
    getsockname(listen_fd_, reinterpret_cast<sockaddr *>(&addr), &len);
    port_ = ntohs(addr.sin_port);
  }

  ~LoopbackGateway()
  {
    if (client_fd_ >= 0) {
      ::close(client_fd_);
    }
    if (listen_fd_ >= 0) {
      ::close(listen_fd_);
    }
  }

  int port() const { return port_; }

  bool accept_client()
  {
    pollfd pfd{listen_fd_, POLLIN, 0};
    if (poll(&pfd, 1, 1000) <= 0) {
      return false;
    }
    client_fd_ = accept(listen_fd_, nullptr, nullptr);
    return client_fd_ >= 0;
  }

  std::vector<uint8_t> read_exact(size_t n)
  {
    std::vector<uint8_t> out;
    while (out.size() < n) {
      pollfd pfd{client_fd_, POLLIN, 0};
      if (poll(&pfd, 1, 1000) <= 0) {
        break;
      }
      uint8_t buf[256];
      const auto r = recv(client_fd_, buf, std::min(sizeof(buf), n - out.size()), 0);
      if (r <= 0) {
        break;
      }
      out.insert(out.end(), buf, buf + r);
    }
    return out;
  }

  void disconnect_client()
  {
    ::close(client_fd_);
    client_fd_ = -1;
  }

  // linger 0 으로 닫아 RST 를 보낸다
  void reset_client()
  {
    linger lg{1, 0};
    setsockopt(client_fd_, SOL_SOCKET, SO_LINGER, &lg, sizeof(lg));
    disconnect_client();
  }

private:
  int listen_fd_ = -1;
  int client_fd_ = -1;
  int port_ = 0;
};

TransportConfig loopback_config(int port)
{
  TransportConfig config;
  config.kind = "tcp";
  config.host = "127.0.0.1";
  config.port = port;
  config.connect_timeout_ms = 1000;
  config.reply_timeout_ms = 50;
  config.inter_command_delay_ms = 35;
  return config;
}

}  // namespace

TEST(TcpTransport, DefaultPreambleIsSameInBothEncodings)
{
  const std::vector<uint8_t> expected(luci::kRegisterPreamble.begin(), luci::kRegisterPreamble.end());
  EXPECT_EQ(encode_preamble(PreambleEncoding::RAW), expected);
  EXPECT_EQ(encode_preamble(PreambleEncoding::TEXT), expected);
}

TEST(TcpTransport, SendsPreambleThenPackets)
{
  LoopbackGateway gateway;
  TcpTransport t(loopback_config(gateway.port()));

  ASSERT_TRUE(t.open().ok);
  EXPECT_TRUE(t.is_open());
  ASSERT_TRUE(gateway.accept_client());

  const std::vector<uint8_t> preamble{0x00, 0x00, 0x02, 0x03, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00};
  EXPECT_EQ(gateway.read_exact(preamble.size()), preamble);

  const std::vector<uint8_t> first{0x00, 0x00, 0x02, 0xFE, 0x00, 0x01};
  const std::vector<uint8_t> second{0x00, 0x00, 0x02, 0xFE, 0x00, 0x02};
  const auto start = std::chrono::steady_clock::now();
  ASSERT_TRUE(t.send(first).ok);
  ASSERT_TRUE(t.send(second).ok);
  EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(35));

  std::vector<uint8_t> expected = first;
  expected.insert(expected.end(), second.begin(), second.end());
  EXPECT_EQ(gateway.read_exact(expected.size()), expected);

  t.close();
  EXPECT_FALSE(t.is_open());
  EXPECT_EQ(t.send(first).code, ErrorCode::NOT_CONNECTED);
}

TEST(TcpTransport, ClosedPortIsRefused)
{
  int port = 0;
  {
    LoopbackGateway closed;
    port = closed.port();
  }
  TcpTransport t(loopback_config(port));
  const auto result = t.open();
  EXPECT_FALSE(result.ok);
  EXPECT_EQ(result.code, ErrorCode::CONNECT_REFUSED);
  EXPECT_FALSE(t.is_open());
}

TEST(TcpTransport, FullBacklogTimesOut)
{
  // backlog 0 이면 accept 큐가 하나 찬 뒤의 SYN 은 응답 없이 버려진다
  LoopbackGateway gateway(0);
  std::vector<int> fillers;
  for (int i = 0; i < 3; ++i) {
    const int fd = socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = htons(static_cast<uint16_t>(gateway.port()));
    connect(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr));
    fillers.push_back(fd);
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }

  auto config = loopback_config(gateway.port());
  config.connect_timeout_ms = 200;
  TcpTransport t(config);
  const auto start = std::chrono::steady_clock::now();
  const auto result = t.open();
  EXPECT_FALSE(result.ok);
  EXPECT_EQ(result.code, ErrorCode::CONNECT_TIMEOUT);
  EXPECT_FALSE(t.is_open());
  EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(200));
  EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(3));

  for (const int fd : fillers) {
    ::close(fd);
  }
}

TEST(TcpTransport, ResetByPeerIsIoError)
{
  LoopbackGateway gateway;
  TcpTransport t(loopback_config(gateway.port()));
  ASSERT_TRUE(t.open().ok);
  ASSERT_TRUE(gateway.accept_client());
  gateway.read_exact(10);
  gateway.reset_client();
  std::this_thread::sleep_for(std::chrono::milliseconds(50));

  const std::vector<uint8_t> packet{0x00, 0x00, 0x02, 0xFE, 0x00, 0x01};
  CommandResult result = CommandResult::success();
  for (int i = 0; i < 3 && result.ok; ++i) {
    result = t.send(packet);
  }
  EXPECT_FALSE(result.ok);
  EXPECT_EQ(result.code, ErrorCode::IO_ERROR);
  // 연결 정리는 호출자 몫
  EXPECT_TRUE(t.is_open());
}

TEST(TcpTransport, InvalidHostIsRefused)
{
  auto config = loopback_config(7777);
  config.host = "not-an-ip";
  TcpTransport t(config);
  const auto result = t.open();
  EXPECT_FALSE(result.ok);
  EXPECT_EQ(result.code, ErrorCode::CONNECT_REFUSED);
}

TEST(TcpTransport, ReopenAfterPeerClose)
{
  LoopbackGateway gateway;
  TcpTransport t(loopback_config(gateway.port()));
  ASSERT_TRUE(t.open().ok);
  ASSERT_TRUE(gateway.accept_client());
  gateway.read_exact(10);
  gateway.disconnect_client();

  ASSERT_TRUE(t.open().ok);
  ASSERT_TRUE(gateway.accept_client());
  EXPECT_EQ(gateway.read_exact(10).size(), 10u);
}
