#pragma once

#include "luci_servo_cpp/servo_constants.hpp"

#include <cstdint>

namespace luci_servo_cpp
{

/// 각도(deg) -> goal position 레지스터 값. 범위 밖 입력은 clamp 된다.
///   AX/XL: 0~300 deg -> 0~1023,  MX: 0~360 deg -> 0~4095
uint16_t degrees_to_position(double degrees, MotorFamily family);

/// 속도(RPM) -> moving speed 레지스터 값 (0~1023).
///   AX/XL: 114 RPM full scale,  MX: 117 RPM full scale
uint16_t rpm_to_velocity(double rpm, MotorFamily family);

/// 서보 baud rate 레지스터(주소 4) 값: round(2,000,000 / bps) - 1
/// 0~254 범위를 벗어나면 std::invalid_argument
uint8_t baud_register_value(double target_bps);

}  // namespace luci_servo_cpp
