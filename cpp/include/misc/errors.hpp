#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace Bi5 {

class Error : public std::runtime_error {
public:
  explicit Error(const std::string &message) : std::runtime_error(message) {}
};

// path missing, neither file nor directory, or read failure
class IoError : public Error {
public:
  using Error::Error;
};

// malformed compressed stream
class DecompressError : public Error {
public:
  using Error::Error;
};

// decompressed payload is not a whole number of records
class FormatError : public Error {
public:
  FormatError(size_t observed_size, size_t record_size)
      : Error("Decompressed buffer length " + std::to_string(observed_size) +
              " is not a multiple of " + std::to_string(record_size)),
        observed_size_(observed_size), record_size_(record_size) {}

  size_t observed_size() const { return observed_size_; }
  size_t record_size() const { return record_size_; }

private:
  size_t observed_size_;
  size_t record_size_;
};

class ConfigError : public Error {
public:
  using Error::Error;
};

} // namespace Bi5
