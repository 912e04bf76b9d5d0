#pragma once

#include "document_extractor.hpp"

namespace ragline_core {

/**
 * @class PlainTextExtractor
 * @brief One segment per page of a text or markdown file.
 *
 * Pages are separated by form feeds, the page break PDF-to-text converters emit;
 * a file without form feeds is a single page. Blank pages are skipped but still
 * counted, so PAGE_FIELD (1-based) always matches the source page.
 */
class PlainTextExtractor : public DocumentExtractor {
 public:
  static constexpr const char *PAGE_FIELD = "page";
  static constexpr char PAGE_SEPARATOR = '\f';

  bool can_handle(const fs::path &file_path) const override;
  std::vector<RawSegment> extract(const fs::path &file_path) const override;
  DocumentType get_document_type() const override {
    return DocumentType::Text;
  }
};

}  // namespace ragline_core
