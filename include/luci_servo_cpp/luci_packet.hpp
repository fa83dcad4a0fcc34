#pragma once

#include "luci_servo_cpp/servo_constants.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace luci_servo_cpp
{

/// LUCI 봉투 형식
///   UART_BRIDGE : sub packet0 = [uart port, baud index] + bus frame (TCP 게이트웨이 / USB 브리지)
///   DIRECT      : sub packet0 = bus frame
///   GENERAL     : 10바이트 general 헤더 + bus frame (LS5 단독 스크립트 형식)
enum class EnvelopeLayout : uint8_t
{
  UART_BRIDGE = 0,
  DIRECT = 1,
  GENERAL = 2
};

const char * envelope_layout_name(EnvelopeLayout layout);
bool parse_envelope_layout(const std::string & name, EnvelopeLayout & out);

/// UART_BRIDGE sub packet0 앞에 붙는 2바이트
struct UartHeader
{
  uint8_t port = luci::kUartPort;
  uint8_t baud_index = luci::kFallbackBaudIndex;
};

struct EnvelopeConfig
{
  EnvelopeLayout layout = EnvelopeLayout::UART_BRIDGE;
  uint16_t module_number = luci::kRobotControllerModule;
  uint8_t mode = luci::kModeWrite;
  uint32_t bus_baudrate = luci::kDefaultBusBaudRate;
};

/// 게이트웨이 baud 테이블 인덱스. 테이블에 없는 값은 57142 (index 6) 로 대체한다.
uint8_t baud_rate_index(uint32_t baud_rate);
bool is_supported_baud_rate(uint32_t baud_rate);

/// LUCI 봉투 생성
///   mode 4/5 : 3바이트 prefix 만 반환 (short form)
///   그 외    : prefix, module(LE16), 0 0 0, total(LE16)=len(sub0)+5, mode,
///              len(sub0)(LE16), 0(LE16), sub0
/// uart 가 있으면 sub0 = [port, baud index] + bus frame, 없으면 bus frame 그대로
std::vector<uint8_t> wrap(
  uint16_t module_number, uint8_t mode, const std::vector<uint8_t> & bus_frame,
  const std::optional<UartHeader> & uart = std::nullopt);

/// LS5 general 헤더: prefix, module(LE16), 0 0 0, len(payload)(LE16), payload
std::vector<uint8_t> wrap_general(uint16_t module_number, const std::vector<uint8_t> & payload);

/// 설정된 layout 에 맞춰 봉투 생성
std::vector<uint8_t> wrap_envelope(const EnvelopeConfig & config, const std::vector<uint8_t> & bus_frame);

bool is_short_form_mode(uint8_t mode);

}  // namespace luci_servo_cpp
