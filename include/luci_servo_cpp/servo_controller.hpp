#pragma once

#include "luci_servo_cpp/command_result.hpp"
#include "luci_servo_cpp/luci_packet.hpp"
#include "luci_servo_cpp/servo_constants.hpp"
#include "luci_servo_cpp/transport.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <vector>

namespace luci_servo_cpp
{

struct ControllerConfig
{
  EnvelopeConfig envelope;

  // send_all / move_to_neutral 대상 서보 세트
  std::vector<uint8_t> motor_ids{1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12};
  std::vector<MotorModel> motor_models = std::vector<MotorModel>(kDefaultServoCount, MotorModel::AX12);
  double default_velocity_rpm = kDefaultVelocityRpm;
  std::vector<double> neutral_pose{kNeutralPose.begin(), kNeutralPose.end()};

  // true 면 모든 위치 명령을 send_positions_debug 경로로 보낸다
  bool debug_frames = false;
};

/// 단계별 중간 결과 (디버그/트러블슈팅용)
struct FrameTrace
{
  std::vector<uint16_t> positions;
  std::vector<uint16_t> velocities;
  std::vector<uint8_t> bus_frame;
  std::vector<uint8_t> envelope;
};

/// 서보 명령 facade: 단위 변환 -> SYNC_WRITE -> LUCI 봉투 -> Transport
/// 한 Transport 에 대해 단일 호출자를 가정한다.
class ServoController
{
public:
  ServoController(std::unique_ptr<Transport> transport, const ControllerConfig & config = ControllerConfig());
  ~ServoController();

  ServoController(const ServoController &) = delete;
  ServoController & operator=(const ServoController &) = delete;

  CommandResult connect();
  void disconnect();
  bool is_connected() const;

  /// 각 서보에 goal position(deg) + moving speed(RPM) 를 한 SYNC_WRITE 로 전송.
  /// 네 목록의 길이가 다르거나 비어 있으면 I/O 없이 INVALID_ARGUMENT.
  CommandResult send_positions(
    const std::vector<uint8_t> & motor_ids,
    const std::vector<MotorFamily> & families,
    const std::vector<double> & positions_deg,
    const std::vector<double> & velocities_rpm,
    uint32_t bus_baudrate,
    FrameTrace * trace = nullptr);

  CommandResult send_positions(
    const std::vector<uint8_t> & motor_ids,
    const std::vector<MotorFamily> & families,
    const std::vector<double> & positions_deg,
    const std::vector<double> & velocities_rpm);

  /// send_positions 와 같지만 단계별 프레임을 trace 에 담고 로그로 출력
  CommandResult send_positions_debug(
    const std::vector<uint8_t> & motor_ids,
    const std::vector<MotorFamily> & families,
    const std::vector<double> & positions_deg,
    const std::vector<double> & velocities_rpm,
    uint32_t bus_baudrate,
    FrameTrace & trace);

  /// 설정된 서보 세트(기본 ID 1~12, AX12, 30 RPM)에 위치 전송
  CommandResult send_all(const std::vector<double> & positions_deg);
  CommandResult send_all(const std::vector<double> & positions_deg, const std::vector<double> & velocities_rpm);

  CommandResult move_to_neutral();

  /// 단일 WRITE 명령 (설정 레지스터 쓰기용)
  CommandResult write_register(
    uint8_t motor_id, uint8_t address, const std::vector<uint8_t> & data, uint32_t bus_baudrate);

  /// 서보 자체 baud rate 변경 (레지스터 4)
  CommandResult set_servo_baud_rate(uint8_t motor_id, double target_bps, uint32_t bus_baudrate);

  /// 포즈 목록을 순서대로 send_all. 매 명령 전과 hold 중에 stop 을 확인한다.
  /// 전송에 성공한 포즈 수를 반환하고, 실패 시 last_error 에 결과를 남긴다.
  size_t play_sequence(
    const std::vector<std::vector<double>> & poses,
    const std::atomic<bool> & stop,
    std::chrono::milliseconds hold,
    CommandResult * last_error = nullptr);

  /// start 부터 end 까지(포함) step 간격 포즈, 각 포즈는 count 개 서보가 같은 각도
  static std::vector<std::vector<double>> make_sweep(double start, double end, double step, size_t count);

  const ControllerConfig & config() const { return config_; }

private:
  CommandResult send_frame(const std::vector<uint8_t> & bus_frame, uint32_t bus_baudrate, FrameTrace * trace);
  std::vector<MotorFamily> configured_families() const;

  std::unique_ptr<Transport> transport_;
  ControllerConfig config_;
};

}  // namespace luci_servo_cpp
