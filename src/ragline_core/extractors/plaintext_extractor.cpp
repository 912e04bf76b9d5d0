#include "ragline_core/extractors/plaintext_extractor.hpp"

#include <algorithm>
#include <cctype>

namespace ragline_core {

bool PlainTextExtractor::can_handle(const fs::path &file_path) const {
  const std::string extension = file_path.extension().string();
  return extension == ".txt" || extension == ".md";
}

std::vector<RawSegment> PlainTextExtractor::extract(const fs::path &file_path) const {
  const std::string content = get_string_content(file_path);
  if (content.empty()) {
    return {};
  }

  const Metadata base = base_metadata(file_path, content);
  std::vector<RawSegment> segments;

  size_t page = 1;
  size_t start = 0;
  while (start <= content.size()) {
    size_t end = content.find(PAGE_SEPARATOR, start);
    if (end == std::string::npos) {
      end = content.size();
    }

    std::string page_text = content.substr(start, end - start);
    const bool blank = std::all_of(page_text.begin(), page_text.end(),
                                   [](unsigned char c) { return std::isspace(c); });
    if (!blank) {
      RawSegment segment;
      segment.text = std::move(page_text);
      segment.source_metadata = base;
      segment.source_metadata[PAGE_FIELD] = std::to_string(page);
      segments.push_back(std::move(segment));
    }

    ++page;
    start = end + 1;
  }
  return segments;
}

}  // namespace ragline_core
