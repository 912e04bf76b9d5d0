#pragma once

#include "document_extractor.hpp"

namespace ragline_core {

/**
 * @class CsvExtractor
 * @brief One segment per data row of a CSV file with a header row.
 *
 * Segment text is one "column: value" line per column. Quoted fields may contain
 * commas, doubled quotes and line breaks. Each segment records its 0-based data
 * row under ROW_FIELD.
 */
class CsvExtractor : public DocumentExtractor {
 public:
  static constexpr const char *ROW_FIELD = "row";

  bool can_handle(const fs::path &file_path) const override;
  std::vector<RawSegment> extract(const fs::path &file_path) const override;
  DocumentType get_document_type() const override {
    return DocumentType::Csv;
  }

  // @throw DocumentUnreadable on an unterminated quoted field.
  static std::vector<std::vector<std::string>> parse_records(const std::string &content);
};

}  // namespace ragline_core
