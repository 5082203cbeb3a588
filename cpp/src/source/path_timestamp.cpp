#include "source/path_timestamp.hpp"

#include <charconv>
#include <iomanip>
#include <sstream>
#include <string_view>
#include <system_error>
#include <vector>

namespace Bi5 {

namespace {

// whole-string decimal parse, no sign, no whitespace
std::optional<unsigned> parse_unsigned(std::string_view text) {
  if (text.empty()) {
    return std::nullopt;
  }
  unsigned value = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc{} || ptr != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}

std::optional<Timestamp> make_timestamp(unsigned y, unsigned m, unsigned d, unsigned h,
                                        unsigned mi = 0, unsigned s = 0) {
  // chrono::month/day store a single byte, range-check before constructing
  if (y > static_cast<unsigned>(static_cast<int>(std::chrono::year::max())) || m > 12 || d > 31) {
    return std::nullopt;
  }
  const std::chrono::year_month_day ymd{std::chrono::year{static_cast<int>(y)},
                                        std::chrono::month{m},
                                        std::chrono::day{d}};
  if (!ymd.ok() || h > 23 || mi > 59 || s > 59) {
    return std::nullopt;
  }
  return std::chrono::sys_days{ymd} + std::chrono::hours{h} +
         std::chrono::minutes{mi} + std::chrono::seconds{s};
}

} // namespace

std::optional<Timestamp> resolve_path_timestamp(const std::filesystem::path &path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return std::nullopt;
  }
  return parse_path_timestamp(path);
}

std::optional<Timestamp> parse_path_timestamp(const std::filesystem::path &path) {
  std::vector<std::string> segments;
  for (const auto &part : path) {
    segments.push_back(part.string());
  }
  // trailing separator yields an empty final element
  if (!segments.empty() && segments.back().empty()) {
    segments.pop_back();
  }
  if (segments.size() < 4) {
    return std::nullopt;
  }

  const std::string &file_name = segments[segments.size() - 1];
  if (file_name.size() < 2) {
    return std::nullopt;
  }

  auto hour = parse_unsigned(std::string_view(file_name).substr(0, 2));
  auto day = parse_unsigned(segments[segments.size() - 2]);
  auto month = parse_unsigned(segments[segments.size() - 3]); // zero-based on disk
  auto year = parse_unsigned(segments[segments.size() - 4]);
  if (!hour || !day || !month || !year) {
    return std::nullopt;
  }
  if (*month > 11) {
    return std::nullopt;
  }

  return make_timestamp(*year, *month + 1, *day, *hour);
}

std::string format_timestamp(Timestamp ts) {
  const auto days = std::chrono::floor<std::chrono::days>(ts);
  const std::chrono::year_month_day ymd{days};
  const std::chrono::hh_mm_ss<std::chrono::seconds> hms{ts - days};

  std::ostringstream oss;
  oss << std::setfill('0') << std::setw(4) << static_cast<int>(ymd.year()) << "-"
      << std::setw(2) << static_cast<unsigned>(ymd.month()) << "-"
      << std::setw(2) << static_cast<unsigned>(ymd.day()) << "T"
      << std::setw(2) << hms.hours().count() << ":"
      << std::setw(2) << hms.minutes().count() << ":"
      << std::setw(2) << hms.seconds().count();
  return oss.str();
}

std::optional<Timestamp> parse_timestamp(const std::string &text) {
  // YYYY-MM-DDTHH:MM:SS
  if (text.size() != 19 || text[4] != '-' || text[7] != '-' ||
      (text[10] != 'T' && text[10] != ' ') || text[13] != ':' || text[16] != ':') {
    return std::nullopt;
  }
  const std::string_view view(text);
  auto year = parse_unsigned(view.substr(0, 4));
  auto month = parse_unsigned(view.substr(5, 2));
  auto day = parse_unsigned(view.substr(8, 2));
  auto hour = parse_unsigned(view.substr(11, 2));
  auto minute = parse_unsigned(view.substr(14, 2));
  auto second = parse_unsigned(view.substr(17, 2));
  if (!year || !month || !day || !hour || !minute || !second) {
    return std::nullopt;
  }
  return make_timestamp(*year, *month, *day, *hour, *minute, *second);
}

} // namespace Bi5
