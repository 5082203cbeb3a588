#pragma once

#include "codec/Bi5_DataType.hpp"
#include <cstddef>
#include <filesystem>
#include <optional>
#include <vector>

namespace Bi5 {

// ============================================================================
// DIRECTORY WALK
// ============================================================================
// Depth-first, pre-order walk of every descendant of a root directory.
// Siblings are visited by sort key: the timestamp inferred from the entry's
// path, or ZERO_TIMESTAMP when none (sub-directories, unconventional names).
// Equal keys fall back to the entry name: decimal names come first in
// numeric order (so month "10" follows month "9"), any other names follow
// in byte order.
//
// The walk state is an explicit stack with one sorted listing per open
// directory; its depth equals the nesting depth of the current entry.
// Symlinked directories are not descended into.

class DirectoryWalk {
public:
  struct QualifyingEntry {
    std::filesystem::path path;
    Timestamp timestamp;
  };

  // throws IoError if the root cannot be listed
  explicit DirectoryWalk(const std::filesystem::path &root);

  // Next regular file with a resolvable timestamp, nullopt when exhausted.
  // Directories and files without a timestamp are passed over silently.
  // Throws IoError if a sub-directory cannot be listed; that directory is
  // dropped, so calling again continues with its next sibling.
  std::optional<QualifyingEntry> next_qualifying();

  size_t depth() const { return stack_.size(); }

private:
  struct Entry {
    std::filesystem::path path;
    bool is_directory;
    std::optional<Timestamp> timestamp;
  };

  struct Level {
    std::vector<Entry> entries;
    size_t index = 0;
  };

  static std::vector<Entry> list_sorted(const std::filesystem::path &dir);
  static bool entry_less(const Entry &lhs, const Entry &rhs);

  std::vector<Level> stack_;
};

} // namespace Bi5
