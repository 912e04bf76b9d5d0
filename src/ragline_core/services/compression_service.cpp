#include "ragline_core/services/compression_service.hpp"

#include <zstd.h>

namespace ragline_core {

std::vector<char> CompressionService::compress(std::string_view data, int compression_level) {
  if (compression_level < ZSTD_minCLevel() || compression_level > ZSTD_maxCLevel()) {
    throw CompressionError("zstd level " + std::to_string(compression_level) + " is out of range [" +
                           std::to_string(ZSTD_minCLevel()) + ", " +
                           std::to_string(ZSTD_maxCLevel()) + "]");
  }
  if (data.empty()) {
    return {};
  }

  std::vector<char> buffer(ZSTD_compressBound(data.size()));
  const size_t written =
      ZSTD_compress(buffer.data(), buffer.size(), data.data(), data.size(), compression_level);
  if (ZSTD_isError(written)) {
    throw CompressionError(std::string("zstd compression failed: ") + ZSTD_getErrorName(written));
  }
  buffer.resize(written);
  return buffer;
}

std::string CompressionService::decompress(const std::vector<char> &compressed_data) {
  if (compressed_data.empty()) {
    return {};
  }

  const unsigned long long expected =
      ZSTD_getFrameContentSize(compressed_data.data(), compressed_data.size());
  if (expected == ZSTD_CONTENTSIZE_ERROR) {
    throw CompressionError("Buffer is not a zstd frame");
  }
  if (expected == ZSTD_CONTENTSIZE_UNKNOWN) {
    throw CompressionError("zstd frame does not record its content size");
  }

  std::string text(expected, '\0');
  const size_t produced =
      ZSTD_decompress(text.data(), text.size(), compressed_data.data(), compressed_data.size());
  if (ZSTD_isError(produced)) {
    throw CompressionError(std::string("zstd decompression failed: ") + ZSTD_getErrorName(produced));
  }
  if (produced != expected) {
    throw CompressionError("zstd frame decoded to " + std::to_string(produced) +
                           " bytes, header says " + std::to_string(expected));
  }
  return text;
}

}  // namespace ragline_core
