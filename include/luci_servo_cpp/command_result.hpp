#pragma once

#include <cstdint>
#include <string>

namespace luci_servo_cpp
{

enum class ErrorCode : uint8_t
{
  NONE = 0,
  INVALID_ARGUMENT,
  NOT_CONNECTED,
  CONNECT_TIMEOUT,
  CONNECT_REFUSED,
  IO_ERROR
};

const char * error_code_name(ErrorCode code);

/// 전송/명령 결과. ok=false 이면 code, error에 원인이 담긴다.
struct CommandResult
{
  bool ok = false;
  ErrorCode code = ErrorCode::NONE;
  std::string error;

  static CommandResult success()
  {
    CommandResult out;
    out.ok = true;
    return out;
  }

  static CommandResult failure(ErrorCode code, const std::string & error)
  {
    CommandResult out;
    out.code = code;
    out.error = error;
    return out;
  }
};

}  // namespace luci_servo_cpp
