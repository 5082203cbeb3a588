#pragma once

#include "codec/Bi5_DataType.hpp"
#include <filesystem>
#include <optional>
#include <string>

namespace Bi5 {

// Infer the period-start of a tick file from its trailing path segments:
//   .../<YEAR>/<MONTH, zero-based>/<DAY>/<HH>...
// Only the first two characters of the file name are read (the hour).
// Returns nullopt when the path is not a regular file or the segments do
// not form a valid calendar date/hour. Absence is a normal outcome.
std::optional<Timestamp> resolve_path_timestamp(const std::filesystem::path &path);

// Same parse, without touching the filesystem
std::optional<Timestamp> parse_path_timestamp(const std::filesystem::path &path);

// Example: format_timestamp(2020-01-15 07:00) returns "2020-01-15T07:00:00"
std::string format_timestamp(Timestamp ts);

// Accepts "YYYY-MM-DDTHH:MM:SS" or "YYYY-MM-DD HH:MM:SS"
std::optional<Timestamp> parse_timestamp(const std::string &text);

} // namespace Bi5
