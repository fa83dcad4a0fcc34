#pragma once

#include <string>

#include <termios.h>

namespace luci_servo_cpp
{

/// baud rate 를 termios speed 로 변환. 지원하지 않는 값은 supported=false, B57600 반환
speed_t baud_to_speed(int baudrate, bool & supported);

/// raw 8N1 모드, 흐름제어 없음, 배타적 접근으로 시리얼 포트를 연다.
/// 입출력 버퍼는 비운 상태로 반환한다. 실패 시 -1, error 에 원인.
int open_serial_port(const std::string & device, int baudrate, double timeout_sec, std::string & error);

}  // namespace luci_servo_cpp
