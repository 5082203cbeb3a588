#pragma once

#include "codec/Bi5_DataType.hpp"
#include <cstddef>
#include <cstdint>
#include <vector>

namespace Bi5 {

// Decode one record from exactly TICK_SIZE bytes at fixed offsets
Tick decode_tick(const uint8_t *bytes);

// ============================================================================
// RECORD CURSOR
// ============================================================================
// Walks a decompressed payload one record at a time. Owns the buffer so the
// memory is released together with the frame that holds the cursor.

class RecordCursor {
public:
  RecordCursor() = default;
  explicit RecordCursor(std::vector<uint8_t> buffer);

  // false when fewer than TICK_SIZE bytes remain (end of data)
  bool next(Tick &out);

  size_t remaining_records() const { return (buffer_.size() - position_) / TICK_SIZE; }
  size_t position() const { return position_; }

private:
  std::vector<uint8_t> buffer_;
  size_t position_ = 0;
};

} // namespace Bi5
