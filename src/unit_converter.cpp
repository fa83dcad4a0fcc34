#include "luci_servo_cpp/unit_converter.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <stdexcept>
#include <string>

using namespace std;


namespace luci_servo_cpp
{

namespace
{

uint16_t scale_and_clamp(double value, double full_scale_in, double full_scale_out)
{
  if (std::isnan(value)) {
    return 0;
  }
  const double scaled = clamp(value / full_scale_in * full_scale_out, 0.0, full_scale_out);
  return static_cast<uint16_t>(lround(scaled));
}

}  // namespace

uint16_t degrees_to_position(double degrees, MotorFamily family)
{
  switch (family) {
    case MotorFamily::MX:
      return scale_and_clamp(degrees, 360.0, 4095.0);
    case MotorFamily::AX:
    case MotorFamily::XL:
    default:
      return scale_and_clamp(degrees, 300.0, 1023.0);
  }
}

uint16_t rpm_to_velocity(double rpm, MotorFamily family)
{
  switch (family) {
    case MotorFamily::MX:
      return scale_and_clamp(rpm, 117.0, 1023.0);
    case MotorFamily::AX:
    case MotorFamily::XL:
    default:
      return scale_and_clamp(rpm, 114.0, 1023.0);
  }
}

uint8_t baud_register_value(double target_bps)
{
  if (!(target_bps > 0.0)) {
    throw invalid_argument("target baud rate must be positive");
  }
  const double value = round(2000000.0 / target_bps) - 1.0;
  if (value < 0.0 || value > 254.0) {
    char buf[64];
    snprintf(buf, sizeof(buf), "baud register value out of range for %.0f bps", target_bps);
    throw invalid_argument(buf);
  }
  return static_cast<uint8_t>(value);
}

}  // namespace luci_servo_cpp
