#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace luci_servo_cpp
{

enum class MotorFamily : uint8_t
{
  AX = 0,
  MX = 1,
  XL = 2
};

/// 게이트웨이 앱과 동일한 모터 타입 코드
enum class MotorModel : uint8_t
{
  AX12 = 0,
  AX18 = 1,
  MX28 = 2,
  MX64 = 3,
  MX106 = 4,
  XL320 = 5
};

MotorFamily family_of(MotorModel model);
const char * motor_model_name(MotorModel model);
/// "AX12", "mx-64" 등 모델 이름 파싱 (대소문자, '-' 무시)
bool parse_motor_model(const std::string & name, MotorModel & out);

namespace dxl
{
constexpr uint8_t kHeader = 0xFF;
constexpr uint8_t kBroadcastId = 0xFE;
constexpr uint8_t kMinMotorId = 1;
constexpr uint8_t kMaxMotorId = 252;
constexpr uint8_t kInstWrite = 0x03;
constexpr uint8_t kInstSyncWrite = 0x83;

constexpr uint8_t kAddrBaudRate = 4;
constexpr uint8_t kAddrGoalPosition = 30;
// goal position(2) + moving speed(2)
constexpr uint8_t kGoalPayloadLength = 4;
}  // namespace dxl

namespace luci
{
constexpr std::array<uint8_t, 3> kPrefix{0x00, 0x00, 0x02};
constexpr uint16_t kRobotControllerModule = 254;
constexpr uint8_t kModeWrite = 0;
constexpr uint8_t kModeShortA = 4;
constexpr uint8_t kModeShortB = 5;
constexpr uint8_t kUartPort = 0;
constexpr uint16_t kDefaultTcpPort = 7777;
constexpr std::array<uint8_t, 10> kRegisterPreamble{0, 0, 2, 3, 0, 0, 0, 0, 0, 0};

constexpr std::array<uint32_t, 8> kBaudRates{
  2000000, 1000000, 500000, 222222, 117647, 100000, 57142, 9615};
constexpr uint32_t kDefaultBusBaudRate = 57142;
constexpr uint8_t kFallbackBaudIndex = 6;
}  // namespace luci

constexpr std::size_t kDefaultServoCount = 12;
constexpr double kDefaultVelocityRpm = 30.0;
constexpr std::array<double, kDefaultServoCount> kNeutralPose{
  150.0, 90.0, 150.0, 150.0, 210.0, 150.0, 150.0, 90.0, 150.0, 150.0, 210.0, 150.0};

constexpr int kConnectTimeoutMs = 5000;
constexpr int kReplyTimeoutMs = 500;
constexpr int kInterCommandDelayMs = 35;
constexpr int kSerialSettleMs = 500;
constexpr int kDefaultSerialBaudRate = 57600;

}  // namespace luci_servo_cpp
