#pragma once

#include "luci_servo_cpp/transport.hpp"

#include <string>
#include <vector>

namespace luci_servo_cpp
{

/// 등록 preamble 바이트 (encoding 적용 후)
std::vector<uint8_t> encode_preamble(PreambleEncoding encoding);

/// LS5/LS6 TCP 게이트웨이 전송 계층.
/// 연결 직후 등록 preamble 을 한 번 보내고 응답은 reply timeout 동안만 기다린다.
class TcpTransport : public Transport
{
public:
  explicit TcpTransport(const TransportConfig & config);
  ~TcpTransport() override;

  CommandResult open() override;
  void close() override;
  bool is_open() const override;
  std::string describe() const override;

protected:
  CommandResult write_all(const std::vector<uint8_t> & data) override;
  std::vector<uint8_t> drain_reply() override;

private:
  CommandResult connect_socket();
  void read_registration_reply();

  std::string host_;
  int port_;
  int connect_timeout_ms_;
  int reply_timeout_ms_;
  PreambleEncoding preamble_encoding_;

  int socket_fd_{-1};
};

}  // namespace luci_servo_cpp
