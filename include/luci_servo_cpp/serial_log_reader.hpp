#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace luci_servo_cpp
{

/// 수신 바이트를 줄 단위로 모은다. '\n' 으로 분리하고 '\r'/양끝 공백 제거,
/// UTF-8 로 해석할 수 없는 바이트는 조용히 버리며 빈 줄은 건너뛴다.
class LineAssembler
{
public:
  explicit LineAssembler(size_t max_line_length = 4096);

  std::vector<std::string> push(const uint8_t * data, size_t len);
  std::vector<std::string> push(const std::vector<uint8_t> & data);
  /// 개행 없이 남은 조각을 한 줄로 내보낸다
  std::vector<std::string> flush();

private:
  void emit(std::vector<std::string> & out);

  size_t max_line_length_;
  std::vector<uint8_t> pending_;
};

/// 게이트웨이 콘솔 로그를 읽는 시리얼 리더. 명령 전송 경로와는 별도 포트/스레드를 쓴다.
class SerialLogReader
{
public:
  using LineCallback = std::function<void (const std::string & line)>;

  SerialLogReader(const std::string & device, int baudrate, int poll_interval_ms = 100);
  ~SerialLogReader();

  SerialLogReader(const SerialLogReader &) = delete;
  SerialLogReader & operator=(const SerialLogReader &) = delete;

  void set_callback(LineCallback cb);

  bool start();
  void stop();
  bool is_running() const;
  std::string last_error() const;

  /// 텍스트 명령 전송 (개행이 없으면 추가)
  bool send_line(const std::string & command);
  /// Ctrl+C (0x03) 전송
  bool send_interrupt();

private:
  void read_task();
  bool write_bytes(const std::vector<uint8_t> & data);
  void deliver(const std::vector<std::string> & lines);

  std::string device_;
  int baudrate_;
  int poll_interval_ms_;

  int fd_{-1};
  mutable std::mutex port_mutex_;
  std::string last_error_;

  std::atomic<bool> running_{false};
  std::thread read_thread_;

  std::mutex cb_mutex_;
  LineCallback callback_;

  LineAssembler assembler_;
};

}  // namespace luci_servo_cpp
