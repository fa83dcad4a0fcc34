#include "luci_servo_cpp/servo_controller.hpp"

#include "luci_servo_cpp/byte_utils.hpp"
#include "luci_servo_cpp/dynamixel_packet.hpp"
#include "luci_servo_cpp/unit_converter.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

#include "rclcpp/rclcpp.hpp"

using namespace std;


namespace luci_servo_cpp
{

namespace
{

rclcpp::Logger logger()
{
  return rclcpp::get_logger("luci_servo_cpp.controller");
}

string join_ids(const vector<uint8_t> & ids)
{
  string out;
  for (size_t i = 0; i < ids.size(); ++i) {
    if (i > 0) {
      out += ",";
    }
    out += to_string(ids[i]);
  }
  return out;
}

}  // namespace

ServoController::ServoController(unique_ptr<Transport> transport, const ControllerConfig & config)
: transport_(move(transport)), config_(config)
{
  if (!transport_) {
    throw invalid_argument("servo controller needs a transport");
  }
}

ServoController::~ServoController()
{
  disconnect();
}

CommandResult ServoController::connect()
{
  return transport_->open();
}

void ServoController::disconnect()
{
  if (transport_->is_open()) {
    transport_->close();
    RCLCPP_INFO(logger(), "disconnected from %s", transport_->describe().c_str());
  }
}

bool ServoController::is_connected() const
{
  return transport_->is_open();
}

CommandResult ServoController::send_positions(
  const vector<uint8_t> & motor_ids,
  const vector<MotorFamily> & families,
  const vector<double> & positions_deg,
  const vector<double> & velocities_rpm,
  uint32_t bus_baudrate,
  FrameTrace * trace)
{
  if (motor_ids.size() != families.size() ||
    motor_ids.size() != positions_deg.size() ||
    motor_ids.size() != velocities_rpm.size())
  {
    return CommandResult::failure(
      ErrorCode::INVALID_ARGUMENT,
      "all lists must have the same length (ids=" + to_string(motor_ids.size()) +
      " families=" + to_string(families.size()) +
      " positions=" + to_string(positions_deg.size()) +
      " velocities=" + to_string(velocities_rpm.size()) + ")");
  }

  vector<SyncWriteEntry> entries;
  entries.reserve(motor_ids.size());
  for (size_t i = 0; i < motor_ids.size(); ++i) {
    const auto pos = degrees_to_position(positions_deg[i], families[i]);
    const auto vel = rpm_to_velocity(velocities_rpm[i], families[i]);
    if (trace) {
      trace->positions.push_back(pos);
      trace->velocities.push_back(vel);
    }
    entries.push_back(SyncWriteEntry{motor_ids[i], position_velocity_payload(pos, vel)});
  }

  vector<uint8_t> frame;
  try {
    frame = build_sync_write(dxl::kAddrGoalPosition, dxl::kGoalPayloadLength, entries);
  } catch (const invalid_argument & e) {
    return CommandResult::failure(ErrorCode::INVALID_ARGUMENT, e.what());
  }
  return send_frame(frame, bus_baudrate, trace);
}

CommandResult ServoController::send_positions(
  const vector<uint8_t> & motor_ids,
  const vector<MotorFamily> & families,
  const vector<double> & positions_deg,
  const vector<double> & velocities_rpm)
{
  if (config_.debug_frames) {
    FrameTrace trace;
    return send_positions_debug(
      motor_ids, families, positions_deg, velocities_rpm, config_.envelope.bus_baudrate, trace);
  }
  return send_positions(
    motor_ids, families, positions_deg, velocities_rpm, config_.envelope.bus_baudrate);
}

CommandResult ServoController::send_positions_debug(
  const vector<uint8_t> & motor_ids,
  const vector<MotorFamily> & families,
  const vector<double> & positions_deg,
  const vector<double> & velocities_rpm,
  uint32_t bus_baudrate,
  FrameTrace & trace)
{
  trace = FrameTrace();
  RCLCPP_INFO(logger(), "[debug] sending to %zu motors: ids=[%s]", motor_ids.size(), join_ids(motor_ids).c_str());

  const auto result = send_positions(
    motor_ids, families, positions_deg, velocities_rpm, bus_baudrate, &trace);

  for (size_t i = 0; i < trace.positions.size() && i < motor_ids.size(); ++i) {
    RCLCPP_INFO(
      logger(), "[debug]   motor %u: %.1f deg -> %u, %.1f rpm -> %u",
      motor_ids[i], positions_deg[i], trace.positions[i], velocities_rpm[i], trace.velocities[i]);
  }
  if (!trace.bus_frame.empty()) {
    RCLCPP_INFO(
      logger(), "[debug]   dynamixel frame (%zu bytes): %s",
      trace.bus_frame.size(), to_hex(trace.bus_frame).c_str());
  }
  if (!trace.envelope.empty()) {
    RCLCPP_INFO(
      logger(), "[debug]   luci envelope (%zu bytes): %s",
      trace.envelope.size(), to_hex(trace.envelope).c_str());
  }
  if (result.ok) {
    RCLCPP_INFO(logger(), "[debug]   sent %zu bytes", trace.envelope.size());
  } else {
    RCLCPP_WARN(
      logger(), "[debug]   failed (%s): %s", error_code_name(result.code), result.error.c_str());
  }
  return result;
}

CommandResult ServoController::send_all(const vector<double> & positions_deg)
{
  return send_all(positions_deg, vector<double>(config_.motor_ids.size(), config_.default_velocity_rpm));
}

CommandResult ServoController::send_all(
  const vector<double> & positions_deg, const vector<double> & velocities_rpm)
{
  return send_positions(config_.motor_ids, configured_families(), positions_deg, velocities_rpm);
}

CommandResult ServoController::move_to_neutral()
{
  return send_all(config_.neutral_pose);
}

CommandResult ServoController::write_register(
  uint8_t motor_id, uint8_t address, const vector<uint8_t> & data, uint32_t bus_baudrate)
{
  vector<uint8_t> frame;
  try {
    frame = build_write(motor_id, address, data);
  } catch (const invalid_argument & e) {
    return CommandResult::failure(ErrorCode::INVALID_ARGUMENT, e.what());
  }
  return send_frame(frame, bus_baudrate, nullptr);
}

CommandResult ServoController::set_servo_baud_rate(uint8_t motor_id, double target_bps, uint32_t bus_baudrate)
{
  uint8_t value = 0;
  try {
    value = baud_register_value(target_bps);
  } catch (const invalid_argument & e) {
    return CommandResult::failure(ErrorCode::INVALID_ARGUMENT, e.what());
  }

  RCLCPP_INFO(
    logger(), "servo %u baud register (addr=%u) -> %u (target ~%.0f bps)",
    motor_id, dxl::kAddrBaudRate, value, target_bps);
  return write_register(motor_id, dxl::kAddrBaudRate, {value}, bus_baudrate);
}

size_t ServoController::play_sequence(
  const vector<vector<double>> & poses,
  const atomic<bool> & stop,
  chrono::milliseconds hold,
  CommandResult * last_error)
{
  size_t sent = 0;
  for (const auto & pose : poses) {
    if (stop) {
      break;
    }
    const auto result = send_all(pose);
    if (!result.ok) {
      if (last_error) {
        *last_error = result;
      }
      break;
    }
    ++sent;

    const auto deadline = chrono::steady_clock::now() + hold;
    while (!stop && chrono::steady_clock::now() < deadline) {
      this_thread::sleep_for(min(chrono::milliseconds(10), hold));
    }
  }
  return sent;
}

vector<vector<double>> ServoController::make_sweep(double start, double end, double step, size_t count)
{
  if (!std::isfinite(start) || !std::isfinite(end)) {
    throw invalid_argument("sweep start and end must be finite");
  }
  if (step == 0.0 || !std::isfinite(step) || (end - start) * step < 0.0) {
    throw invalid_argument("sweep step must move from start towards end");
  }

  vector<vector<double>> poses;
  const auto n = static_cast<size_t>(floor((end - start) / step + 1e-9)) + 1;
  poses.reserve(n);
  for (size_t i = 0; i < n; ++i) {
    poses.emplace_back(count, start + step * static_cast<double>(i));
  }
  return poses;
}

CommandResult ServoController::send_frame(const vector<uint8_t> & bus_frame, uint32_t bus_baudrate, FrameTrace * trace)
{
  auto envelope_config = config_.envelope;
  envelope_config.bus_baudrate = bus_baudrate;

  vector<uint8_t> envelope;
  try {
    envelope = wrap_envelope(envelope_config, bus_frame);
  } catch (const invalid_argument & e) {
    return CommandResult::failure(ErrorCode::INVALID_ARGUMENT, e.what());
  }

  if (trace) {
    trace->bus_frame = bus_frame;
    trace->envelope = envelope;
  }
  return transport_->send(envelope);
}

vector<MotorFamily> ServoController::configured_families() const
{
  vector<MotorFamily> families;
  families.reserve(config_.motor_models.size());
  for (const auto m : config_.motor_models) {
    families.push_back(family_of(m));
  }
  return families;
}

}  // namespace luci_servo_cpp
