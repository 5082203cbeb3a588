#pragma once

#include "source/reader_config.hpp"
#include <string>

namespace JsonConfig {

// Reader config parser
// {
//   "codec": "auto" | "lzma" | "zstd",
//   "error_policy": "stop" | "skip" | "propagate",
//   "log_dir": "/var/log/bi5",
//   "base_timestamp": "2020-01-15T07:00:00"
// }
// Missing keys keep their defaults; bad values throw Bi5::ConfigError.
Bi5::ReaderConfig ParseReaderConfig(const std::string &config_file);
Bi5::ReaderConfig ParseReaderConfigString(const std::string &config_text);

} // namespace JsonConfig
