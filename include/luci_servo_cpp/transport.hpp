#pragma once

#include "luci_servo_cpp/command_result.hpp"
#include "luci_servo_cpp/servo_constants.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace luci_servo_cpp
{

/// TCP 등록 preamble 전송 방식.
/// TEXT: 기존 앱처럼 UTF-8 문자열로 해석 후 재인코딩 (해석 불가 바이트 제거), RAW: 그대로 전송
enum class PreambleEncoding : uint8_t
{
  TEXT = 0,
  RAW = 1
};

bool parse_preamble_encoding(const std::string & name, PreambleEncoding & out);

/// 전송 종류 이름을 "serial" / "tcp" 로 정규화 (대소문자, 공백 무시, "usb" 는 serial)
bool parse_transport_kind(const std::string & name, std::string & out);

struct TransportConfig
{
  // "serial" | "tcp"
  std::string kind = "serial";

  std::string device = "/dev/ttyUSB0";
  int serial_baudrate = kDefaultSerialBaudRate;
  int serial_settle_ms = kSerialSettleMs;

  std::string host = "192.168.1.100";
  int port = luci::kDefaultTcpPort;
  int connect_timeout_ms = kConnectTimeoutMs;
  int reply_timeout_ms = kReplyTimeoutMs;
  PreambleEncoding preamble_encoding = PreambleEncoding::TEXT;

  int inter_command_delay_ms = kInterCommandDelayMs;
  bool log_replies = false;
};

/// 하나의 연결(시리얼 포트 또는 TCP 소켓)을 소유하는 전송 계층.
/// send() 는 직전 전송 이후 inter-command delay 가 지날 때까지 기다린 뒤 쓴다.
/// 동시 호출은 지원하지 않으며 호출자가 직렬화해야 한다.
class Transport
{
public:
  Transport(int inter_command_delay_ms, bool log_replies);
  virtual ~Transport() = default;

  Transport(const Transport &) = delete;
  Transport & operator=(const Transport &) = delete;

  virtual CommandResult open() = 0;
  virtual void close() = 0;
  virtual bool is_open() const = 0;
  virtual std::string describe() const = 0;

  CommandResult send(const std::vector<uint8_t> & packet);

  std::chrono::milliseconds inter_command_delay() const { return inter_command_delay_; }
  std::chrono::steady_clock::time_point next_send_time() const { return next_send_time_; }

protected:
  virtual CommandResult write_all(const std::vector<uint8_t> & data) = 0;
  /// 대기 없이 수신 버퍼에 남은 응답을 읽어 버린다
  virtual std::vector<uint8_t> drain_reply() = 0;

  /// 다음 전송 가능 시각을 t 이후로 미룬다
  void hold_until(std::chrono::steady_clock::time_point t);
  void reset_pacing();
  bool log_replies() const { return log_replies_; }

private:
  std::chrono::milliseconds inter_command_delay_;
  bool log_replies_;
  std::chrono::steady_clock::time_point next_send_time_{};
};

std::unique_ptr<Transport> make_transport(const TransportConfig & config);

}  // namespace luci_servo_cpp
