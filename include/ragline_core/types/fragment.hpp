#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace ragline_core {

using Metadata = std::map<std::string, std::string>;
using FragmentId = std::int64_t;

// Ids are assigned from 1; 0 asks the index to assign one.
inline constexpr FragmentId kUnassignedFragmentId = 0;

// One unit emitted by a document extractor (a CSV row, a page of text).
struct RawSegment {
  std::string text;
  Metadata source_metadata;
};

struct Fragment {
  FragmentId id = kUnassignedFragmentId;
  std::string text;
  Metadata source_metadata;
  // Empty until embedded.
  std::vector<float> embedding;
};

struct RetrievedFragment {
  Fragment fragment;
  float distance;
};

// Ascending by distance.
using RetrievalResult = std::vector<RetrievedFragment>;

}  // namespace ragline_core
