#pragma once

#include "codec/Bi5_DataType.hpp"
#include "codec/stream_decompressor.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace Bi5 {

// What a directory traversal does when the next file cannot be opened,
// decompressed or validated after iteration has started.
enum class ErrorPolicy : uint8_t {
  Stop,      // end the traversal (logged)
  Skip,      // log, drop the file, continue with the next one
  Propagate, // rethrow from TickStream::next()
};

std::optional<ErrorPolicy> parse_error_policy(std::string_view name);
const char *error_policy_to_string(ErrorPolicy policy);

struct ReaderConfig {
  Codec codec = Codec::Auto;
  ErrorPolicy error_policy = ErrorPolicy::Stop;
  std::string log_dir;                     // empty: fall back to BI5_LOG_DIR
  std::optional<Timestamp> base_timestamp; // single-file sources only
};

// BI5_LOG_DIR, or "" when unset
std::string default_log_dir();

// Start Logger once per process, before the first TickSource::iter().
// Uses config.log_dir, else default_log_dir(); returns false when neither
// names a directory (logging stays off). Later calls keep the first
// directory, as Logger::init does.
bool init_logging(const ReaderConfig &config);

} // namespace Bi5
