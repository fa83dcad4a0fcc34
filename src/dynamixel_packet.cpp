#include "luci_servo_cpp/dynamixel_packet.hpp"

#include "luci_servo_cpp/byte_utils.hpp"
#include "luci_servo_cpp/servo_constants.hpp"

#include <array>
#include <stdexcept>
#include <string>

using namespace std;


namespace luci_servo_cpp
{

bool is_motor_id(uint8_t id)
{
  return id >= dxl::kMinMotorId && id <= dxl::kMaxMotorId;
}

uint8_t dxl_checksum(uint8_t id, uint8_t length, uint8_t instruction, const vector<uint8_t> & params)
{
  uint32_t sum = static_cast<uint32_t>(id) + length + instruction;
  for (const auto b : params) {
    sum += b;
  }
  return static_cast<uint8_t>(255 - (sum & 0xFF));
}

vector<uint8_t> build_write(uint8_t id, uint8_t address, const vector<uint8_t> & data)
{
  // 1~252 개별 모터 또는 0xFE broadcast
  if (!is_motor_id(id) && id != dxl::kBroadcastId) {
    throw invalid_argument("invalid motor id " + to_string(id));
  }
  if (data.empty()) {
    throw invalid_argument("write data is empty");
  }
  // params = address + data, length = params + 2
  if (data.size() + 3 > 255) {
    throw invalid_argument("write data too long: " + to_string(data.size()));
  }

  vector<uint8_t> params;
  params.reserve(data.size() + 1);
  params.push_back(address);
  params.insert(params.end(), data.begin(), data.end());
  const auto length = static_cast<uint8_t>(params.size() + 2);

  vector<uint8_t> buf;
  buf.reserve(params.size() + 6);
  buf.push_back(dxl::kHeader);
  buf.push_back(dxl::kHeader);
  buf.push_back(id);
  buf.push_back(length);
  buf.push_back(dxl::kInstWrite);
  buf.insert(buf.end(), params.begin(), params.end());
  buf.push_back(dxl_checksum(id, length, dxl::kInstWrite, params));
  return buf;
}

vector<uint8_t> build_sync_write(
  uint8_t start_address, uint8_t data_length, const vector<SyncWriteEntry> & entries)
{
  if (entries.empty()) {
    throw invalid_argument("sync write needs at least one motor");
  }
  if (data_length == 0) {
    throw invalid_argument("sync write data length must be positive");
  }
  const size_t packet_length = (static_cast<size_t>(data_length) + 1) * entries.size() + 4;
  if (packet_length > 255) {
    throw invalid_argument(
            "sync write too long for " + to_string(entries.size()) + " motors (length " +
            to_string(packet_length) + ")");
  }

  array<bool, 256> seen{};
  vector<uint8_t> params;
  params.reserve(packet_length);
  params.push_back(start_address);
  params.push_back(data_length);
  for (const auto & e : entries) {
    if (!is_motor_id(e.id)) {
      throw invalid_argument("invalid motor id in sync write: " + to_string(e.id));
    }
    if (seen[e.id]) {
      throw invalid_argument("duplicate motor id in sync write: " + to_string(e.id));
    }
    seen[e.id] = true;
    if (e.data.size() != data_length) {
      throw invalid_argument(
              "motor " + to_string(e.id) + " data length " + to_string(e.data.size()) +
              " != " + to_string(data_length));
    }
    params.push_back(e.id);
    params.insert(params.end(), e.data.begin(), e.data.end());
  }

  const auto length = static_cast<uint8_t>(packet_length);
  vector<uint8_t> buf;
  buf.reserve(packet_length + 4);
  buf.push_back(dxl::kHeader);
  buf.push_back(dxl::kHeader);
  buf.push_back(dxl::kBroadcastId);
  buf.push_back(length);
  buf.push_back(dxl::kInstSyncWrite);
  buf.insert(buf.end(), params.begin(), params.end());
  buf.push_back(dxl_checksum(dxl::kBroadcastId, length, dxl::kInstSyncWrite, params));
  return buf;
}

vector<uint8_t> position_velocity_payload(uint16_t position, uint16_t velocity)
{
  vector<uint8_t> data;
  data.reserve(dxl::kGoalPayloadLength);
  append_u16(data, position);
  append_u16(data, velocity);
  return data;
}

bool verify_frame(const vector<uint8_t> & frame)
{
  // FF FF id len instr checksum 가 최소 길이
  if (frame.size() < 6 || frame[0] != dxl::kHeader || frame[1] != dxl::kHeader) {
    return false;
  }
  const uint8_t length = frame[3];
  if (frame.size() != static_cast<size_t>(length) + 4) {
    return false;
  }
  const vector<uint8_t> params(frame.begin() + 5, frame.end() - 1);
  return dxl_checksum(frame[2], length, frame[4], params) == frame.back();
}

}  // namespace luci_servo_cpp
