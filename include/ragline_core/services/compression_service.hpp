#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace ragline_core {

class CompressionError : public std::runtime_error {
 public:
  explicit CompressionError(const std::string &message) : std::runtime_error(message) {}
};

/**
 * @brief Zstandard compression for fragment text stored on disk.
 *
 * Empty input maps to an empty buffer in both directions, so empty fragments
 * cost nothing in the index file.
 */
class CompressionService {
 public:
  static constexpr int DEFAULT_LEVEL = 3;

  /**
   * @throw CompressionError if the level is outside zstd's supported range or
   *        compression fails.
   */
  static std::vector<char> compress(std::string_view data, int compression_level = DEFAULT_LEVEL);

  /**
   * @throw CompressionError if the buffer is not a single zstd frame with a
   *        recorded content size, or does not decode to that size.
   */
  static std::string decompress(const std::vector<char> &compressed_data);
};

}  // namespace ragline_core
