#pragma once

#include <cstdint>
#include <utility>
#include <vector>

namespace luci_servo_cpp
{

/// SYNC_WRITE 한 항목: (motor id, 레지스터 데이터)
struct SyncWriteEntry
{
  uint8_t id = 0;
  std::vector<uint8_t> data;
};

/// 개별 모터 id 범위 (1~252) 확인
bool is_motor_id(uint8_t id);

/// Dynamixel Protocol 1.0 checksum: 255 - ((id + length + instruction + sum(params)) & 0xFF)
/// 0xFF 0xFF 헤더는 포함하지 않는다.
uint8_t dxl_checksum(
  uint8_t id, uint8_t length, uint8_t instruction, const std::vector<uint8_t> & params);

/// WRITE(0x03) 프레임: FF FF id len 03 address data... checksum
/// id 는 1~252 또는 broadcast 0xFE. 그 외 id 나 빈 data 는 std::invalid_argument
std::vector<uint8_t> build_write(uint8_t id, uint8_t address, const std::vector<uint8_t> & data);

/// SYNC_WRITE(0x83) 프레임 (broadcast id 0xFE). 항목 순서대로 (id, data) 를 이어 붙인다.
/// 빈 항목, 1~252 밖의 id, data 길이 불일치, 중복 id, 255 초과 길이는 std::invalid_argument
std::vector<uint8_t> build_sync_write(
  uint8_t start_address, uint8_t data_length, const std::vector<SyncWriteEntry> & entries);

/// goal position + moving speed 4바이트 payload [posLo, posHi, velLo, velHi]
std::vector<uint8_t> position_velocity_payload(uint16_t position, uint16_t velocity);

/// 완성된 프레임의 checksum 바이트를 다시 계산해 비교
bool verify_frame(const std::vector<uint8_t> & frame);

}  // namespace luci_servo_cpp
