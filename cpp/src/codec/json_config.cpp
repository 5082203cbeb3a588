#include "codec/json_config.hpp"
#include "misc/errors.hpp"
#include "source/path_timestamp.hpp"

#include <fstream>
#include <nlohmann/json.hpp>

namespace JsonConfig {

namespace {

Bi5::ReaderConfig FromJson(const nlohmann::json &j) {
  if (!j.is_object()) {
    throw Bi5::ConfigError("Reader config must be a JSON object");
  }

  Bi5::ReaderConfig config;

  try {
    if (j.contains("codec")) {
      const std::string name = j["codec"].get<std::string>();
      auto codec = Bi5::parse_codec(name);
      if (!codec) {
        throw Bi5::ConfigError("Unknown codec: " + name);
      }
      config.codec = *codec;
    }

    if (j.contains("error_policy")) {
      const std::string name = j["error_policy"].get<std::string>();
      auto policy = Bi5::parse_error_policy(name);
      if (!policy) {
        throw Bi5::ConfigError("Unknown error_policy: " + name);
      }
      config.error_policy = *policy;
    }

    config.log_dir = j.value("log_dir", config.log_dir);

    const std::string ts_str = j.value("base_timestamp", "");
    if (!ts_str.empty()) {
      config.base_timestamp = Bi5::parse_timestamp(ts_str);
      if (!config.base_timestamp) {
        throw Bi5::ConfigError("Invalid base_timestamp, expected YYYY-MM-DDTHH:MM:SS: " + ts_str);
      }
    }
  } catch (const nlohmann::json::exception &e) {
    throw Bi5::ConfigError(std::string("Invalid reader config: ") + e.what());
  }

  return config;
}

} // namespace

Bi5::ReaderConfig ParseReaderConfig(const std::string &config_file) {
  std::ifstream file(config_file);
  if (!file.is_open()) {
    throw Bi5::ConfigError("Failed to open config file: " + config_file);
  }

  nlohmann::json j;
  try {
    file >> j;
  } catch (const nlohmann::json::parse_error &e) {
    throw Bi5::ConfigError("Failed to parse config file " + config_file + ": " + e.what());
  }
  return FromJson(j);
}

Bi5::ReaderConfig ParseReaderConfigString(const std::string &config_text) {
  nlohmann::json j;
  try {
    j = nlohmann::json::parse(config_text);
  } catch (const nlohmann::json::parse_error &e) {
    throw Bi5::ConfigError(std::string("Failed to parse reader config: ") + e.what());
  }
  return FromJson(j);
}

} // namespace JsonConfig
