#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>

// bi5 tick files (one compressed file per instrument-hour):
//   <root>/<SYMBOL>/<YEAR>/<MONTH, zero-based>/<DAY>/<HH>h_ticks.bi5
// payload: N * 20 bytes, big-endian, no header, no checksum

namespace Bi5 {

// naive calendar time (no zone), second resolution
using Timestamp = std::chrono::sys_seconds;

// Wire layout (20 bytes total, big-endian)
inline constexpr size_t OFFSET_MS_POS = 0;  // u32 - ms since period start
inline constexpr size_t ASK_POS = 4;        // u32 - fixed-point price
inline constexpr size_t BID_POS = 8;        // u32 - fixed-point price
inline constexpr size_t ASK_SIZE_POS = 12;  // f32 - volume
inline constexpr size_t BID_SIZE_POS = 16;  // f32 - volume
inline constexpr size_t TICK_SIZE = 20;

struct Tick {
  uint32_t offset_ms; // milliseconds since the start of the file's period
  uint32_t ask;       // price scale is a convention of the data vendor
  uint32_t bid;
  float ask_size;
  float bid_size;

  bool operator==(const Tick &) const = default;
};

// unit flowing through TickStream; absolute time = base + offset_ms
struct TimestampedTick {
  Timestamp base;
  Tick tick;
};

// 0000-01-01T00:00:00
inline constexpr Timestamp ZERO_TIMESTAMP =
    std::chrono::sys_days{std::chrono::year{0} / std::chrono::January / 1};

inline Timestamp or_zero(const std::optional<Timestamp> &ts) {
  return ts.value_or(ZERO_TIMESTAMP);
}

} // namespace Bi5
