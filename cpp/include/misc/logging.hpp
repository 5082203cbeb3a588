/*
 * LOGGING FOR THE BI5 TICK READER
 *
 * File-backed logs kept out of the hot path: nothing is written until
 * Logger::init() is called, so library users who do not care about logs
 * pay one branch per call.
 *
 * Channels:
 * - decode.log: decompression results and rejected payloads
 * - walk.log:   directory traversal (skipped files, early termination)
 *
 * Usage:
 *   Logger::init(log_dir);
 *   Logger::log_decode("Decompressed " + path);
 *   Logger::log_walk("Skipping unreadable file: " + path);
 *   Logger::close();
 */

#pragma once

#include <string>

namespace Logger {

// Initialize logging system with a log directory (created if missing)
void init(const std::string &log_dir);

// Close all log files
void close();

// Decompression logging functions
void log_decode(const std::string &message);

// Directory traversal logging functions
void log_walk(const std::string &message);

// Check if logging is initialized
bool is_initialized();

} // namespace Logger
