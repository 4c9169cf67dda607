#pragma once

#include <cstdint>
#include <string>

using i8 = std::int8_t;
using i16 = std::int16_t;
using i32 = std::int32_t;
using i64 = std::int64_t;

using u8 = std::uint8_t;
using u16 = std::uint16_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;

using f32 = float;
using f64 = double;

namespace MiniKV {

struct Entry {
  std::string value;
  // absolute deadline in steady-clock milliseconds, 0 when persistent
  i64 expires_at;

  explicit Entry(std::string v) : value(std::move(v)), expires_at(0) {}

  Entry(std::string v, i64 exp) : value(std::move(v)), expires_at(exp) {}

  bool is_persistent() const { return expires_at <= 0; }
  bool is_expired(i64 now_ms) const {
    return !is_persistent() && expires_at <= now_ms;
  }
};

struct SetOptions {
  i64 ttl_ms = -1;
  bool only_if_absent = false;  // NX
  bool only_if_present = false; // XX
};

} // namespace MiniKV
