#include "ragline_core/fragmenter.hpp"

#include <utf8.h>

#include <algorithm>
#include <iterator>

#include "ragline_core/errors.hpp"

namespace ragline_core {

namespace {

bool is_separator(unsigned char c) {
  return c <= 0x20 || c == 0x7F;
}

}  // namespace

Fragmenter::Fragmenter(int chunk_size, int chunk_overlap) {
  if (chunk_size <= 0) {
    throw InvalidConfiguration("chunk_size must be greater than 0, got " +
                               std::to_string(chunk_size));
  }
  if (chunk_overlap < 0) {
    throw InvalidConfiguration("chunk_overlap cannot be negative, got " +
                               std::to_string(chunk_overlap));
  }
  if (chunk_overlap >= chunk_size) {
    throw InvalidConfiguration("chunk_overlap (" + std::to_string(chunk_overlap) +
                               ") must be smaller than chunk_size (" +
                               std::to_string(chunk_size) + ")");
  }
  chunk_size_ = static_cast<size_t>(chunk_size);
  chunk_overlap_ = static_cast<size_t>(chunk_overlap);
}

std::string Fragmenter::normalize(std::string_view text) {
  std::string valid;
  valid.reserve(text.size());
  utf8::replace_invalid(text.begin(), text.end(), std::back_inserter(valid));

  std::string out;
  out.reserve(valid.size());
  bool pending_space = false;
  for (char ch : valid) {
    if (is_separator(static_cast<unsigned char>(ch))) {
      pending_space = !out.empty();
      continue;
    }
    if (pending_space) {
      out.push_back(' ');
      pending_space = false;
    }
    out.push_back(ch);
  }
  return out;
}

std::vector<Fragment> Fragmenter::split(const std::vector<RawSegment> &segments) const {
  std::vector<Fragment> fragments;
  for (const auto &segment : segments) {
    std::vector<Fragment> pieces = split_segment(segment);
    fragments.insert(fragments.end(), std::make_move_iterator(pieces.begin()),
                     std::make_move_iterator(pieces.end()));
  }
  return fragments;
}

std::vector<Fragment> Fragmenter::split_segment(const RawSegment &segment) const {
  const std::string text = normalize(segment.text);
  if (text.empty()) {
    return {};
  }

  // Byte offset of every code point, plus the end of the text.
  std::vector<size_t> boundaries;
  boundaries.reserve(text.size() + 1);
  for (auto it = text.begin(); it != text.end(); utf8::next(it, text.end())) {
    boundaries.push_back(static_cast<size_t>(it - text.begin()));
  }
  const size_t length = boundaries.size();
  boundaries.push_back(text.size());

  const size_t step = chunk_size_ - chunk_overlap_;
  std::vector<Fragment> out;
  for (size_t start = 0;; start += step) {
    const size_t end = std::min(start + chunk_size_, length);

    Fragment fragment;
    fragment.text = text.substr(boundaries[start], boundaries[end] - boundaries[start]);
    fragment.source_metadata = segment.source_metadata;
    fragment.source_metadata[OFFSET_FIELD] = std::to_string(start);
    out.push_back(std::move(fragment));

    if (end == length) {
      break;
    }
  }
  return out;
}

}  // namespace ragline_core
