#include "source/tick_source.hpp"
#include "misc/errors.hpp"
#include "misc/logging.hpp"
#include "source/path_timestamp.hpp"

#include <string>
#include <system_error>
#include <utility>

namespace Bi5 {

// ============================================================================
// TICK STREAM
// ============================================================================

void TickStream::iterator::advance() {
  if (!stream_) {
    return;
  }
  auto item = stream_->next();
  if (item) {
    current_ = *item;
  } else {
    stream_ = nullptr;
  }
}

std::optional<TimestampedTick> TickStream::next() {
  if (auto *file = std::get_if<FileFrame>(&frame_)) {
    Tick tick;
    if (file->cursor.next(tick)) {
      return TimestampedTick{file->timestamp, tick};
    }
    frame_ = EmptyFrame{};
    return std::nullopt;
  }

  if (auto *dir = std::get_if<DirFrame>(&frame_)) {
    try {
      auto item = next_in_dir(*dir);
      if (!item) {
        frame_ = EmptyFrame{};
      }
      return item;
    } catch (const Error &) {
      // ErrorPolicy::Propagate: the stream ends with the error
      frame_ = EmptyFrame{};
      throw;
    }
  }

  return std::nullopt;
}

std::optional<TimestampedTick> TickStream::next_in_dir(DirFrame &dir) {
  Tick tick;
  while (true) {
    if (dir.active.cursor.next(tick)) {
      return TimestampedTick{dir.active.timestamp, tick};
    }

    // release the drained buffer before decompressing the next file
    dir.active.cursor = RecordCursor{};

    auto next_file = open_next(dir.walk, dir.decompressor, dir.policy, false);
    if (!next_file) {
      return std::nullopt;
    }
    dir.active = std::move(*next_file);
  }
}

std::optional<TickStream::FileFrame> TickStream::open_next(DirectoryWalk &walk,
                                                           const StreamDecompressor &decompressor,
                                                           ErrorPolicy policy, bool at_begin) {
  while (true) {
    try {
      auto entry = walk.next_qualifying();
      if (!entry) {
        return std::nullopt;
      }
      Logger::log_walk("Opening " + entry->path.string() + " @ " + format_timestamp(entry->timestamp));
      return FileFrame{RecordCursor(decompressor.decompress_file(entry->path)), entry->timestamp};
    } catch (const Error &e) {
      switch (policy) {
      case ErrorPolicy::Skip:
        Logger::log_walk(std::string("Skipping: ") + e.what());
        continue;
      case ErrorPolicy::Stop:
        if (at_begin) {
          throw;
        }
        Logger::log_walk(std::string("Stopping traversal: ") + e.what());
        return std::nullopt;
      case ErrorPolicy::Propagate:
        throw;
      }
      throw;
    }
  }
}

// ============================================================================
// TICK SOURCE
// ============================================================================

TickSource::TickSource(std::filesystem::path path, std::optional<Timestamp> base, ReaderConfig config)
    : path_(std::move(path)),
      base_(or_zero(base ? base : config.base_timestamp)),
      config_(std::move(config)) {}

bool TickSource::is_file() const {
  std::error_code ec;
  return std::filesystem::is_regular_file(path_, ec);
}

bool TickSource::is_dir() const {
  std::error_code ec;
  return std::filesystem::is_directory(path_, ec);
}

TickStream TickSource::iter() const {
  const StreamDecompressor decompressor(config_.codec);

  if (is_file()) {
    return TickStream(TickStream::FileFrame{RecordCursor(decompressor.decompress_file(path_)), base_});
  }

  if (is_dir()) {
    DirectoryWalk walk(path_);
    auto first = TickStream::open_next(walk, decompressor, config_.error_policy, true);
    if (!first) {
      Logger::log_walk("No qualifying files under " + path_.string());
      return TickStream();
    }
    return TickStream(TickStream::DirFrame{std::move(walk), std::move(*first), decompressor, config_.error_policy});
  }

  throw IoError(path_.string() + " must be file or dir");
}

std::vector<Tick> read_bi5_file(const std::filesystem::path &path, std::optional<Timestamp> base,
                                const ReaderConfig &config) {
  TickSource source(path, base, config);
  TickStream stream = source.iter();

  std::vector<Tick> ticks;
  while (auto item = stream.next()) {
    ticks.push_back(item->tick);
  }
  return ticks;
}

} // namespace Bi5
