#include "source/reader_config.hpp"
#include "misc/logging.hpp"

#include <cstdlib>

namespace Bi5 {

std::optional<ErrorPolicy> parse_error_policy(std::string_view name) {
  if (name == "stop")
    return ErrorPolicy::Stop;
  if (name == "skip")
    return ErrorPolicy::Skip;
  if (name == "propagate")
    return ErrorPolicy::Propagate;
  return std::nullopt;
}

const char *error_policy_to_string(ErrorPolicy policy) {
  switch (policy) {
  case ErrorPolicy::Stop:
    return "stop";
  case ErrorPolicy::Skip:
    return "skip";
  case ErrorPolicy::Propagate:
    return "propagate";
  }
  return "unknown";
}

std::string default_log_dir() {
  const char *env = std::getenv("BI5_LOG_DIR");
  if (env && env[0]) return env;
  return "";
}

bool init_logging(const ReaderConfig &config) {
  const std::string dir = config.log_dir.empty() ? default_log_dir() : config.log_dir;
  if (dir.empty()) {
    return false;
  }
  Logger::init(dir);
  return Logger::is_initialized();
}

} // namespace Bi5
