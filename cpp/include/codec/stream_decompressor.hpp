#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <optional>
#include <string_view>
#include <vector>

namespace Bi5 {

// | Codec | Container                      | Library  |
// |-------|--------------------------------|----------|
// | lzma  | LZMA-alone (.bi5), also .xz    | liblzma  |
// | zstd  | zstd frames (re-packed corpus) | zstd     |
enum class Codec : uint8_t {
  Auto, // zstd when the frame magic is present, lzma otherwise
  Lzma,
  Zstd,
};

std::optional<Codec> parse_codec(std::string_view name);
const char *codec_to_string(Codec codec);

// ============================================================================
// STREAM DECOMPRESSOR
// ============================================================================
// Decompresses a whole compressed tick file into memory and checks that the
// payload is a whole number of TICK_SIZE records.
//
// Errors:
//   IoError         - file cannot be opened or read
//   DecompressError - malformed or truncated compressed stream
//   FormatError     - payload length % TICK_SIZE != 0

class StreamDecompressor {
public:
  explicit StreamDecompressor(Codec codec = Codec::Auto);

  std::vector<uint8_t> decompress_file(const std::filesystem::path &path) const;
  std::vector<uint8_t> decompress_stream(std::istream &in) const;
  std::vector<uint8_t> decompress(const std::vector<uint8_t> &compressed) const;

  static Codec detect_codec(const uint8_t *data, size_t size);

  Codec codec() const { return codec_; }

private:
  static std::vector<uint8_t> decompress_lzma(const uint8_t *data, size_t size);
  static std::vector<uint8_t> decompress_zstd(const uint8_t *data, size_t size);
  static void check_record_alignment(size_t decompressed_size);

  Codec codec_;
};

} // namespace Bi5
