#pragma once

#include "luci_servo_cpp/transport.hpp"

#include <string>

namespace luci_servo_cpp
{

/// USB/시리얼 브리지로 LUCI 패킷을 보내는 전송 계층
class SerialTransport : public Transport
{
public:
  SerialTransport(
    const std::string & device, int baudrate, int settle_ms,
    int inter_command_delay_ms = kInterCommandDelayMs, bool log_replies = false);
  ~SerialTransport() override;

  CommandResult open() override;
  void close() override;
  bool is_open() const override;
  std::string describe() const override;

protected:
  CommandResult write_all(const std::vector<uint8_t> & data) override;
  std::vector<uint8_t> drain_reply() override;

private:
  std::string device_;
  int baudrate_;
  int settle_ms_;
  int fd_{-1};
};

}  // namespace luci_servo_cpp
