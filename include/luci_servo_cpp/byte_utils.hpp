#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

namespace luci_servo_cpp
{

/// little-endian 16bit 값을 버퍼 뒤에 추가
inline void append_u16(std::vector<uint8_t> & out, uint16_t v)
{
  out.push_back(static_cast<uint8_t>(v & 0xFF));
  out.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
}

inline uint16_t read_u16(const std::vector<uint8_t> & data, size_t idx)
{
  return static_cast<uint16_t>(data[idx] | (static_cast<uint16_t>(data[idx + 1]) << 8));
}

/// 로그 출력용 hex 문자열 ("ff ff fe ...")
inline std::string to_hex(const std::vector<uint8_t> & data)
{
  std::string out;
  out.reserve(data.size() * 3);
  char buf[4];
  for (size_t i = 0; i < data.size(); ++i) {
    std::snprintf(buf, sizeof(buf), i == 0 ? "%02x" : " %02x", data[i]);
    out += buf;
  }
  return out;
}

/// UTF-8로 해석할 수 없는 바이트를 버리고 나머지를 그대로 반환
inline std::string utf8_sanitize(const uint8_t * data, size_t len)
{
  std::string out;
  out.reserve(len);
  size_t i = 0;
  while (i < len) {
    const uint8_t c = data[i];
    size_t extra = 0;
    uint32_t cp = 0;
    if (c < 0x80) {
      out.push_back(static_cast<char>(c));
      ++i;
      continue;
    } else if ((c & 0xE0) == 0xC0) {
      extra = 1;
      cp = c & 0x1F;
    } else if ((c & 0xF0) == 0xE0) {
      extra = 2;
      cp = c & 0x0F;
    } else if ((c & 0xF8) == 0xF0) {
      extra = 3;
      cp = c & 0x07;
    } else {
      ++i;
      continue;
    }

    if (i + extra >= len) {
      // 잘린 시퀀스
      ++i;
      continue;
    }
    bool valid = true;
    for (size_t k = 1; k <= extra; ++k) {
      const uint8_t cc = data[i + k];
      if ((cc & 0xC0) != 0x80) {
        valid = false;
        break;
      }
      cp = (cp << 6) | (cc & 0x3F);
    }
    // overlong / surrogate / 범위 초과 거부
    if (valid) {
      if ((extra == 1 && cp < 0x80) || (extra == 2 && cp < 0x800) ||
        (extra == 3 && cp < 0x10000) || cp > 0x10FFFF ||
        (cp >= 0xD800 && cp <= 0xDFFF))
      {
        valid = false;
      }
    }
    if (!valid) {
      ++i;
      continue;
    }
    out.append(reinterpret_cast<const char *>(data + i), extra + 1);
    i += extra + 1;
  }
  return out;
}

inline std::string utf8_sanitize(const std::vector<uint8_t> & data)
{
  return utf8_sanitize(data.data(), data.size());
}

}  // namespace luci_servo_cpp
