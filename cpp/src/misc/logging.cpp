#include "misc/logging.hpp"
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace Logger {

// Internal state
static std::ofstream decode_log;
static std::ofstream walk_log;
static std::mutex decode_log_mutex;
static std::mutex walk_log_mutex;
static std::mutex init_mutex;
static bool initialized = false;

// Helper function to get current timestamp
static std::string get_timestamp() {
  auto now = std::chrono::system_clock::now();
  auto time_t = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) % 1000;

  std::tm local_tm{};
  localtime_r(&time_t, &local_tm);

  std::stringstream ss;
  ss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S");
  ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
  return ss.str();
}

static void open_log(std::ofstream &log, const std::filesystem::path &path, const char *title) {
  log.open(path, std::ios::app);
  if (log.is_open()) {
    log << "[" << get_timestamp() << "] " << title << " Started at: " << path << std::endl;
  } else {
    std::cerr << "Failed to create " << title << " at: " << path << std::endl;
  }
}

static void write_line(std::ofstream &log, std::mutex &mutex, const std::string &message) {
  if (!initialized) return;

  std::lock_guard<std::mutex> lock(mutex);
  if (log.is_open()) {
    log << "[" << get_timestamp() << "] " << message << std::endl;
  }
}

void init(const std::string &log_dir) {
  std::lock_guard<std::mutex> lock(init_mutex);
  if (initialized) {
    return;
  }

  std::filesystem::path dir = std::filesystem::absolute(log_dir);
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    std::cerr << "Failed to create log directory " << dir << ": " << ec.message() << std::endl;
    return;
  }

  open_log(decode_log, dir / "decode.log", "Decode Log");
  open_log(walk_log, dir / "walk.log", "Walk Log");

  initialized = true;
}

void close() {
  std::lock_guard<std::mutex> lock(init_mutex);
  if (!initialized) {
    return;
  }

  if (decode_log.is_open()) {
    decode_log << "[" << get_timestamp() << "] Decode Log Ended" << std::endl;
    decode_log.close();
  }

  if (walk_log.is_open()) {
    walk_log << "[" << get_timestamp() << "] Walk Log Ended" << std::endl;
    walk_log.close();
  }

  initialized = false;
}

void log_decode(const std::string &message) {
  write_line(decode_log, decode_log_mutex, message);
}

void log_walk(const std::string &message) {
  write_line(walk_log, walk_log_mutex, message);
}

bool is_initialized() {
  return initialized;
}

} // namespace Logger
