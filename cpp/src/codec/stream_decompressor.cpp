#include "codec/stream_decompressor.hpp"
#include "codec/Bi5_DataType.hpp"
#include "misc/errors.hpp"
#include "misc/logging.hpp"

#include <fstream>
#include <iterator>
#include <memory>
#include <string>

#include <lzma.h>
#include <zstd.h>

namespace Bi5 {

namespace {

// zstd frame magic number, little-endian on disk
constexpr uint8_t ZSTD_MAGIC[4] = {0x28, 0xB5, 0x2F, 0xFD};

constexpr size_t OUTPUT_CHUNK = 64 * 1024;

const char *lzma_ret_to_string(lzma_ret ret) {
  switch (ret) {
  case LZMA_MEM_ERROR:
    return "out of memory";
  case LZMA_MEMLIMIT_ERROR:
    return "memory limit reached";
  case LZMA_FORMAT_ERROR:
    return "not an lzma/xz stream";
  case LZMA_OPTIONS_ERROR:
    return "unsupported compression options";
  case LZMA_DATA_ERROR:
    return "corrupt compressed data";
  case LZMA_BUF_ERROR:
    return "truncated compressed data";
  default:
    return "unknown lzma error";
  }
}

struct LzmaStreamGuard {
  lzma_stream *strm;
  ~LzmaStreamGuard() { lzma_end(strm); }
};

struct ZstdDStreamDeleter {
  void operator()(ZSTD_DStream *ds) const { ZSTD_freeDStream(ds); }
};

} // namespace

std::optional<Codec> parse_codec(std::string_view name) {
  if (name == "auto")
    return Codec::Auto;
  if (name == "lzma")
    return Codec::Lzma;
  if (name == "zstd")
    return Codec::Zstd;
  return std::nullopt;
}

const char *codec_to_string(Codec codec) {
  switch (codec) {
  case Codec::Auto:
    return "auto";
  case Codec::Lzma:
    return "lzma";
  case Codec::Zstd:
    return "zstd";
  }
  return "unknown";
}

StreamDecompressor::StreamDecompressor(Codec codec) : codec_(codec) {}

Codec StreamDecompressor::detect_codec(const uint8_t *data, size_t size) {
  if (size >= sizeof(ZSTD_MAGIC) &&
      data[0] == ZSTD_MAGIC[0] && data[1] == ZSTD_MAGIC[1] &&
      data[2] == ZSTD_MAGIC[2] && data[3] == ZSTD_MAGIC[3]) {
    return Codec::Zstd;
  }
  return Codec::Lzma;
}

std::vector<uint8_t> StreamDecompressor::decompress_file(const std::filesystem::path &path) const {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) [[unlikely]] {
    throw IoError("Failed to open file for decompression: " + path.string());
  }

  std::vector<uint8_t> buffer;
  try {
    buffer = decompress_stream(file);
  } catch (const IoError &e) {
    throw IoError(std::string(e.what()) + ": " + path.string());
  }

  Logger::log_decode("Decompressed " + path.string() + ": " + std::to_string(buffer.size() / TICK_SIZE) + " ticks");
  return buffer;
}

std::vector<uint8_t> StreamDecompressor::decompress_stream(std::istream &in) const {
  std::vector<uint8_t> compressed{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
  if (in.bad()) [[unlikely]] {
    throw IoError("Failed to read compressed data");
  }
  return decompress(compressed);
}

std::vector<uint8_t> StreamDecompressor::decompress(const std::vector<uint8_t> &compressed) const {
  // empty file: no records, and not a truncated stream
  if (compressed.empty()) {
    return {};
  }

  Codec codec = codec_;
  if (codec == Codec::Auto) {
    codec = detect_codec(compressed.data(), compressed.size());
  }

  std::vector<uint8_t> buffer = codec == Codec::Zstd
                                    ? decompress_zstd(compressed.data(), compressed.size())
                                    : decompress_lzma(compressed.data(), compressed.size());
  check_record_alignment(buffer.size());
  return buffer;
}

std::vector<uint8_t> StreamDecompressor::decompress_lzma(const uint8_t *data, size_t size) {
  lzma_stream strm = LZMA_STREAM_INIT;
  // auto decoder accepts both LZMA-alone and .xz containers
  lzma_ret ret = lzma_auto_decoder(&strm, UINT64_MAX, 0);
  if (ret != LZMA_OK) [[unlikely]] {
    throw DecompressError(std::string("LZMA decoder init failed: ") + lzma_ret_to_string(ret));
  }
  LzmaStreamGuard guard{&strm};

  std::vector<uint8_t> out;
  strm.next_in = data;
  strm.avail_in = size;

  while (true) {
    const size_t written = out.size();
    out.resize(written + OUTPUT_CHUNK);
    strm.next_out = out.data() + written;
    strm.avail_out = OUTPUT_CHUNK;

    ret = lzma_code(&strm, LZMA_FINISH);
    out.resize(out.size() - strm.avail_out);

    if (ret == LZMA_STREAM_END) {
      break;
    }
    if (ret != LZMA_OK) [[unlikely]] {
      throw DecompressError(std::string("LZMA decompression failed: ") + lzma_ret_to_string(ret));
    }
  }

  return out;
}

std::vector<uint8_t> StreamDecompressor::decompress_zstd(const uint8_t *data, size_t size) {
  std::unique_ptr<ZSTD_DStream, ZstdDStreamDeleter> dstream(ZSTD_createDStream());
  if (!dstream) [[unlikely]] {
    throw DecompressError("Zstd decoder init failed");
  }
  size_t ret = ZSTD_initDStream(dstream.get());
  if (ZSTD_isError(ret)) [[unlikely]] {
    throw DecompressError(std::string("Zstd decoder init failed: ") + ZSTD_getErrorName(ret));
  }

  std::vector<uint8_t> out;
  const unsigned long long content_size = ZSTD_getFrameContentSize(data, size);
  if (content_size != ZSTD_CONTENTSIZE_ERROR && content_size != ZSTD_CONTENTSIZE_UNKNOWN) {
    out.reserve(static_cast<size_t>(content_size));
  }

  ZSTD_inBuffer input{data, size, 0};
  size_t last_ret = 0;
  while (input.pos < input.size) {
    const size_t written = out.size();
    out.resize(written + OUTPUT_CHUNK);
    ZSTD_outBuffer output{out.data() + written, OUTPUT_CHUNK, 0};

    last_ret = ZSTD_decompressStream(dstream.get(), &output, &input);
    out.resize(written + output.pos);

    if (ZSTD_isError(last_ret)) [[unlikely]] {
      throw DecompressError(std::string("Zstd decompression failed: ") + ZSTD_getErrorName(last_ret));
    }
  }

  // flush whatever the decoder still holds for a completely consumed frame
  while (last_ret != 0) {
    const size_t written = out.size();
    out.resize(written + OUTPUT_CHUNK);
    ZSTD_outBuffer output{out.data() + written, OUTPUT_CHUNK, 0};

    last_ret = ZSTD_decompressStream(dstream.get(), &output, &input);
    out.resize(written + output.pos);

    if (ZSTD_isError(last_ret)) [[unlikely]] {
      throw DecompressError(std::string("Zstd decompression failed: ") + ZSTD_getErrorName(last_ret));
    }
    if (output.pos == 0 && last_ret != 0) [[unlikely]] {
      throw DecompressError("Zstd decompression failed: truncated frame");
    }
  }

  return out;
}

void StreamDecompressor::check_record_alignment(size_t decompressed_size) {
  if (decompressed_size % TICK_SIZE != 0) [[unlikely]] {
    Logger::log_decode("Rejected payload of " + std::to_string(decompressed_size) + " bytes");
    throw FormatError(decompressed_size, TICK_SIZE);
  }
}

} // namespace Bi5
