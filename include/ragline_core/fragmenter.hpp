#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "ragline_core/types/fragment.hpp"

namespace ragline_core {

/**
 * @class Fragmenter
 * @brief Splits raw segments into bounded-size, overlapping fragments.
 *
 * Each segment is normalized (runs of whitespace and control characters become a
 * single space, invalid UTF-8 is replaced) and then walked with a window of
 * chunk_size code points that advances by chunk_size - chunk_overlap. The last
 * window is truncated to the remaining text. Fragments keep the segment's
 * metadata and record their code point offset under OFFSET_FIELD.
 */
class Fragmenter {
 public:
  static constexpr const char *OFFSET_FIELD = "chunk_offset";

  /**
   * @throw InvalidConfiguration if chunk_size <= 0, chunk_overlap < 0 or
   *        chunk_overlap >= chunk_size.
   */
  Fragmenter(int chunk_size, int chunk_overlap);

  std::vector<Fragment> split(const std::vector<RawSegment> &segments) const;
  std::vector<Fragment> split_segment(const RawSegment &segment) const;

  static std::string normalize(std::string_view text);

  size_t chunk_size() const {
    return chunk_size_;
  }
  size_t chunk_overlap() const {
    return chunk_overlap_;
  }

 private:
  size_t chunk_size_;
  size_t chunk_overlap_;
};

}  // namespace ragline_core
