#include "luci_servo_cpp/servo_constants.hpp"
#include "luci_servo_cpp/command_result.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

using namespace std;


namespace luci_servo_cpp
{

MotorFamily family_of(MotorModel model)
{
  switch (model) {
    case MotorModel::MX28:
    case MotorModel::MX64:
    case MotorModel::MX106:
      return MotorFamily::MX;
    case MotorModel::XL320:
      return MotorFamily::XL;
    case MotorModel::AX12:
    case MotorModel::AX18:
    default:
      return MotorFamily::AX;
  }
}

const char * motor_model_name(MotorModel model)
{
  switch (model) {
    case MotorModel::AX12: return "AX12";
    case MotorModel::AX18: return "AX18";
    case MotorModel::MX28: return "MX28";
    case MotorModel::MX64: return "MX64";
    case MotorModel::MX106: return "MX106";
    case MotorModel::XL320: return "XL320";
    default: return "unknown";
  }
}

bool parse_motor_model(const string & name, MotorModel & out)
{
  string key;
  key.reserve(name.size());
  for (const char c : name) {
    if (c == '-' || c == '_' || isspace(static_cast<unsigned char>(c)) != 0) {
      continue;
    }
    key.push_back(static_cast<char>(toupper(static_cast<unsigned char>(c))));
  }

  static const pair<const char *, MotorModel> kNames[] = {
    {"AX12", MotorModel::AX12}, {"AX12A", MotorModel::AX12},
    {"AX18", MotorModel::AX18}, {"AX18A", MotorModel::AX18},
    {"MX28", MotorModel::MX28}, {"MX64", MotorModel::MX64},
    {"MX106", MotorModel::MX106}, {"XL320", MotorModel::XL320},
  };
  for (const auto & entry : kNames) {
    if (key == entry.first) {
      out = entry.second;
      return true;
    }
  }
  return false;
}

const char * error_code_name(ErrorCode code)
{
  switch (code) {
    case ErrorCode::NONE: return "none";
    case ErrorCode::INVALID_ARGUMENT: return "invalid_argument";
    case ErrorCode::NOT_CONNECTED: return "not_connected";
    case ErrorCode::CONNECT_TIMEOUT: return "connect_timeout";
    case ErrorCode::CONNECT_REFUSED: return "connect_refused";
    case ErrorCode::IO_ERROR: return "io_error";
    default: return "unknown";
  }
}

}  // namespace luci_servo_cpp
