#include "source/directory_walk.hpp"
#include "misc/errors.hpp"
#include "source/path_timestamp.hpp"

#include <algorithm>
#include <string>
#include <system_error>
#include <utility>

namespace Bi5 {

namespace {

bool is_decimal(const std::string &name) {
  return !name.empty() && std::all_of(name.begin(), name.end(), [](char c) { return c >= '0' && c <= '9'; });
}

// -1, 0, 1 like strcmp; arbitrary-length decimal strings
int compare_decimal(const std::string &lhs, const std::string &rhs) {
  const size_t l0 = std::min(lhs.find_first_not_of('0'), lhs.size());
  const size_t r0 = std::min(rhs.find_first_not_of('0'), rhs.size());
  const size_t llen = lhs.size() - l0;
  const size_t rlen = rhs.size() - r0;
  if (llen != rlen) {
    return llen < rlen ? -1 : 1;
  }
  const int cmp = lhs.compare(l0, llen, rhs, r0, rlen);
  return cmp < 0 ? -1 : (cmp > 0 ? 1 : 0);
}

} // namespace

DirectoryWalk::DirectoryWalk(const std::filesystem::path &root) {
  stack_.push_back(Level{list_sorted(root), 0});
}

std::optional<DirectoryWalk::QualifyingEntry> DirectoryWalk::next_qualifying() {
  while (!stack_.empty()) {
    Level &level = stack_.back();
    if (level.index >= level.entries.size()) {
      stack_.pop_back();
      continue;
    }

    Entry entry = std::move(level.entries[level.index++]);

    if (entry.is_directory) {
      // list before pushing: a failed listing leaves the walk consistent
      std::vector<Entry> children = list_sorted(entry.path);
      stack_.push_back(Level{std::move(children), 0});
      continue;
    }

    if (entry.timestamp) {
      return QualifyingEntry{std::move(entry.path), *entry.timestamp};
    }
  }
  return std::nullopt;
}

std::vector<DirectoryWalk::Entry> DirectoryWalk::list_sorted(const std::filesystem::path &dir) {
  std::vector<Entry> entries;

  std::error_code ec;
  std::filesystem::directory_iterator it(dir, ec);
  if (ec) [[unlikely]] {
    throw IoError("Failed to list directory " + dir.string() + ": " + ec.message());
  }

  // increment() turns the iterator into end() on error, checked below
  for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
    const std::filesystem::directory_entry &dirent = *it;

    std::error_code type_ec;
    const bool is_directory = dirent.is_directory(type_ec) && !dirent.is_symlink(type_ec);

    Entry entry;
    entry.path = dirent.path();
    entry.is_directory = is_directory;
    entry.timestamp = is_directory ? std::nullopt : resolve_path_timestamp(entry.path);
    entries.push_back(std::move(entry));
  }
  if (ec) [[unlikely]] {
    throw IoError("Failed to list directory " + dir.string() + ": " + ec.message());
  }

  std::sort(entries.begin(), entries.end(), entry_less);
  return entries;
}

bool DirectoryWalk::entry_less(const Entry &lhs, const Entry &rhs) {
  const Timestamp lkey = or_zero(lhs.timestamp);
  const Timestamp rkey = or_zero(rhs.timestamp);
  if (lkey != rkey) {
    return lkey < rkey;
  }

  const std::string lname = lhs.path.filename().string();
  const std::string rname = rhs.path.filename().string();
  // decimal names first (numeric order), then everything else (byte order)
  const bool ldecimal = is_decimal(lname);
  const bool rdecimal = is_decimal(rname);
  if (ldecimal != rdecimal) {
    return ldecimal;
  }
  if (ldecimal) {
    const int cmp = compare_decimal(lname, rname);
    if (cmp != 0) {
      return cmp < 0;
    }
  }
  return lname < rname;
}

} // namespace Bi5
