#include <gtest/gtest.h>
#include "codec/json_config.hpp"
#include "misc/errors.hpp"
#include "misc/logging.hpp"
#include "source/tick_source.hpp"
#include "tests/fixture_util.hpp"

#include <cstdlib>
#include <fstream>
#include <iterator>
#include <string>

using namespace Bi5;
using fixture::make_ts;

TEST(JsonConfig, ParsesEveryKey) {
  const ReaderConfig config = JsonConfig::ParseReaderConfigString(R"({
    "codec": "zstd",
    "error_policy": "skip",
    "log_dir": "/tmp/bi5_logs",
    "base_timestamp": "2020-01-15T07:00:00"
  })");
  EXPECT_EQ(config.codec, Codec::Zstd);
  EXPECT_EQ(config.error_policy, ErrorPolicy::Skip);
  EXPECT_EQ(config.log_dir, "/tmp/bi5_logs");
  ASSERT_TRUE(config.base_timestamp.has_value());
  EXPECT_EQ(*config.base_timestamp, make_ts(2020, 1, 15, 7));
}

TEST(JsonConfig, MissingKeysKeepDefaults) {
  const ReaderConfig config = JsonConfig::ParseReaderConfigString("{}");
  EXPECT_EQ(config.codec, Codec::Auto);
  EXPECT_EQ(config.error_policy, ErrorPolicy::Stop);
  EXPECT_FALSE(config.base_timestamp.has_value());
}

TEST(JsonConfig, BadValuesAreConfigErrors) {
  EXPECT_THROW(JsonConfig::ParseReaderConfigString(R"({"codec": "gzip"})"), ConfigError);
  EXPECT_THROW(JsonConfig::ParseReaderConfigString(R"({"error_policy": "retry"})"), ConfigError);
  EXPECT_THROW(JsonConfig::ParseReaderConfigString(R"({"base_timestamp": "2020-13-01T00:00:00"})"), ConfigError);
  EXPECT_THROW(JsonConfig::ParseReaderConfigString(R"({"codec": 3})"), ConfigError);
  EXPECT_THROW(JsonConfig::ParseReaderConfigString("[1, 2]"), ConfigError);
  EXPECT_THROW(JsonConfig::ParseReaderConfigString("{not json"), ConfigError);
}

TEST(JsonConfig, ReadsFromFile) {
  fixture::TempDir dir;
  const auto path = dir.path() / "reader.json";
  {
    std::ofstream out(path);
    out << R"({"error_policy": "propagate", "codec": "lzma"})";
  }
  const ReaderConfig config = JsonConfig::ParseReaderConfig(path.string());
  EXPECT_EQ(config.error_policy, ErrorPolicy::Propagate);
  EXPECT_EQ(config.codec, Codec::Lzma);

  EXPECT_THROW(JsonConfig::ParseReaderConfig((dir.path() / "missing.json").string()), ConfigError);
}

TEST(JsonConfig, PolicyNames) {
  EXPECT_EQ(parse_error_policy("stop"), ErrorPolicy::Stop);
  EXPECT_FALSE(parse_error_policy("STOP").has_value());
  EXPECT_STREQ(error_policy_to_string(ErrorPolicy::Propagate), "propagate");
}

TEST(JsonConfig, LogDirTurnsOnTraversalLogs) {
  fixture::TempDir dir;
  const auto data = dir.path() / "data";
  fixture::write_ticks(data / "2020" / "0" / "15" / "07h_ticks.bi5", fixture::make_ticks(2, 1));

  ReaderConfig config;
  config.log_dir = (dir.path() / "logs").string();

  Logger::close();
  ASSERT_TRUE(init_logging(config));
  TickStream stream = TickSource(data, std::nullopt, config).iter();
  while (stream.next()) {
  }
  EXPECT_TRUE(Logger::is_initialized());
  Logger::close();

  EXPECT_TRUE(std::filesystem::exists(dir.path() / "logs" / "walk.log"));
  EXPECT_TRUE(std::filesystem::exists(dir.path() / "logs" / "decode.log"));

  std::ifstream walk_log(dir.path() / "logs" / "walk.log");
  const std::string contents{std::istreambuf_iterator<char>(walk_log), std::istreambuf_iterator<char>()};
  EXPECT_NE(contents.find("2020-01-15T07:00:00"), std::string::npos);
}

TEST(JsonConfig, IterLeavesLoggingToCaller) {
  fixture::TempDir dir;
  const auto data = dir.path() / "data";
  fixture::write_ticks(data / "2020" / "0" / "15" / "07h_ticks.bi5", fixture::make_ticks(2, 1));

  ReaderConfig config;
  config.log_dir = (dir.path() / "logs").string();

  Logger::close();
  TickStream stream = TickSource(data, std::nullopt, config).iter();
  while (stream.next()) {
  }
  EXPECT_FALSE(Logger::is_initialized());
  EXPECT_FALSE(std::filesystem::exists(dir.path() / "logs"));
}

TEST(JsonConfig, EmptyLogDirFallsBackToEnvironment) {
  fixture::TempDir dir;
  const auto logs = dir.path() / "env_logs";

  Logger::close();
  ::setenv("BI5_LOG_DIR", logs.c_str(), 1);
  EXPECT_EQ(default_log_dir(), logs.string());
  EXPECT_TRUE(init_logging(ReaderConfig{}));
  Logger::close();

  ::unsetenv("BI5_LOG_DIR");
  EXPECT_EQ(default_log_dir(), "");
  EXPECT_FALSE(init_logging(ReaderConfig{}));
  EXPECT_FALSE(Logger::is_initialized());
  EXPECT_TRUE(std::filesystem::exists(logs / "walk.log"));
}
