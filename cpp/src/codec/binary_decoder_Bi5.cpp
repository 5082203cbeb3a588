#include "codec/binary_decoder_Bi5.hpp"
#include <cstring>
#include <utility>

namespace Bi5 {

namespace {

inline uint32_t read_be_u32(const uint8_t *p) {
  return (static_cast<uint32_t>(p[0]) << 24) |
         (static_cast<uint32_t>(p[1]) << 16) |
         (static_cast<uint32_t>(p[2]) << 8) |
         static_cast<uint32_t>(p[3]);
}

inline float read_be_f32(const uint8_t *p) {
  static_assert(sizeof(float) == sizeof(uint32_t), "IEEE-754 single precision expected");
  const uint32_t bits = read_be_u32(p);
  float value;
  std::memcpy(&value, &bits, sizeof(value));
  return value;
}

} // namespace

Tick decode_tick(const uint8_t *bytes) {
  Tick tick;
  tick.offset_ms = read_be_u32(bytes + OFFSET_MS_POS);
  tick.ask = read_be_u32(bytes + ASK_POS);
  tick.bid = read_be_u32(bytes + BID_POS);
  tick.ask_size = read_be_f32(bytes + ASK_SIZE_POS);
  tick.bid_size = read_be_f32(bytes + BID_SIZE_POS);
  return tick;
}

RecordCursor::RecordCursor(std::vector<uint8_t> buffer)
    : buffer_(std::move(buffer)) {}

bool RecordCursor::next(Tick &out) {
  if (buffer_.size() - position_ < TICK_SIZE) [[unlikely]] {
    return false;
  }
  out = decode_tick(buffer_.data() + position_);
  position_ += TICK_SIZE;
  return true;
}

} // namespace Bi5
