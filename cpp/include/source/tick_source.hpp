#pragma once

#include "codec/Bi5_DataType.hpp"
#include "codec/binary_decoder_Bi5.hpp"
#include "codec/stream_decompressor.hpp"
#include "source/directory_walk.hpp"
#include "source/reader_config.hpp"

#include <cstddef>
#include <filesystem>
#include <iterator>
#include <optional>
#include <utility>
#include <variant>
#include <vector>

namespace Bi5 {

class TickSource;

// ============================================================================
// TICK STREAM
// ============================================================================
// Lazy, single-pass sequence of (period-start, tick) pairs.
//
// Frames:
//   EmptyFrame - exhausted
//   FileFrame  - one decompressed file, decoded record by record
//   DirFrame   - a sorted directory walk plus the one file currently open
//
// Memory is bounded by one decompressed file: the active buffer is released
// before the next file of a walk is opened. Once next() has returned
// nullopt the stream stays exhausted; build a new TickSource to re-read.
//
// Move-only. An iterator from begin() points at the stream it came from:
// do not move or destroy the stream while that iterator is in use.

class TickStream {
public:
  class iterator {
  public:
    using iterator_category = std::input_iterator_tag;
    using value_type = TimestampedTick;
    using difference_type = std::ptrdiff_t;
    using pointer = const TimestampedTick *;
    using reference = const TimestampedTick &;

    iterator() = default;
    explicit iterator(TickStream *stream) : stream_(stream) { advance(); }

    reference operator*() const { return current_; }
    pointer operator->() const { return &current_; }
    iterator &operator++() {
      advance();
      return *this;
    }
    void operator++(int) { advance(); }

    bool operator==(std::default_sentinel_t) const { return stream_ == nullptr; }

  private:
    void advance();

    TickStream *stream_ = nullptr;
    TimestampedTick current_{};
  };

  TickStream() = default;
  TickStream(TickStream &&) = default;
  TickStream &operator=(TickStream &&) = default;
  TickStream(const TickStream &) = delete;
  TickStream &operator=(const TickStream &) = delete;

  std::optional<TimestampedTick> next();
  bool exhausted() const { return std::holds_alternative<EmptyFrame>(frame_); }

  iterator begin() { return iterator(this); }
  std::default_sentinel_t end() { return std::default_sentinel; }

private:
  friend class TickSource;

  struct EmptyFrame {};

  struct FileFrame {
    RecordCursor cursor;
    Timestamp timestamp;
  };

  struct DirFrame {
    DirectoryWalk walk;
    FileFrame active;
    StreamDecompressor decompressor;
    ErrorPolicy policy;
  };

  using Frame = std::variant<EmptyFrame, FileFrame, DirFrame>;

  explicit TickStream(Frame frame) : frame_(std::move(frame)) {}

  // Open the next qualifying file of the walk. Failures follow the policy;
  // at_begin turns Stop into a thrown error (nothing has been yielded yet).
  static std::optional<FileFrame> open_next(DirectoryWalk &walk, const StreamDecompressor &decompressor,
                                            ErrorPolicy policy, bool at_begin);

  std::optional<TimestampedTick> next_in_dir(DirFrame &dir);

  Frame frame_;
};

// ============================================================================
// TICK SOURCE
// ============================================================================
// A bi5 file or a directory tree of bi5 files. Immutable; owns the path, the
// base timestamp and the reader configuration, never a buffer.

class TickSource {
public:
  // base: period start of a single file; ignored for directories, where each
  // file's timestamp comes from its path. Falls back to config.base_timestamp,
  // then ZERO_TIMESTAMP.
  explicit TickSource(std::filesystem::path path,
                      std::optional<Timestamp> base = std::nullopt,
                      ReaderConfig config = {});

  bool is_file() const;
  bool is_dir() const;

  const std::filesystem::path &path() const { return path_; }
  Timestamp base_timestamp() const { return base_; }
  const ReaderConfig &config() const { return config_; }

  // Begin iteration.
  // Throws IoError if the path is neither a file nor a directory or cannot be
  // read, DecompressError/FormatError if the (first) file is malformed.
  TickStream iter() const;

private:
  std::filesystem::path path_;
  Timestamp base_;
  ReaderConfig config_;
};

// Decompress and decode a whole bi5 file
std::vector<Tick> read_bi5_file(const std::filesystem::path &path,
                                std::optional<Timestamp> base = std::nullopt,
                                const ReaderConfig &config = {});

} // namespace Bi5
