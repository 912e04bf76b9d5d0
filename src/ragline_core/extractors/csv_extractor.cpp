#include "ragline_core/extractors/csv_extractor.hpp"

#include "ragline_core/errors.hpp"

namespace ragline_core {

bool CsvExtractor::can_handle(const fs::path &file_path) const {
  return file_path.extension() == ".csv";
}

std::vector<std::vector<std::string>> CsvExtractor::parse_records(const std::string &content) {
  std::vector<std::vector<std::string>> records;
  std::vector<std::string> record;
  std::string field;
  bool in_quotes = false;
  bool field_started = false;

  auto end_record = [&]() {
    if (field_started || !record.empty()) {
      record.push_back(std::move(field));
      records.push_back(std::move(record));
    }
    record.clear();
    field.clear();
    field_started = false;
  };

  for (size_t i = 0; i < content.size(); ++i) {
    const char c = content[i];
    if (in_quotes) {
      if (c == '"') {
        if (i + 1 < content.size() && content[i + 1] == '"') {
          field.push_back('"');
          ++i;
        } else {
          in_quotes = false;
        }
      } else {
        field.push_back(c);
      }
      continue;
    }

    switch (c) {
      case '"':
        in_quotes = true;
        field_started = true;
        break;
      case ',':
        record.push_back(std::move(field));
        field.clear();
        field_started = true;
        break;
      case '\r':
        break;
      case '\n':
        end_record();
        break;
      default:
        field.push_back(c);
        field_started = true;
        break;
    }
  }

  if (in_quotes) {
    throw DocumentUnreadable("Unterminated quoted field in CSV content");
  }
  end_record();
  return records;
}

std::vector<RawSegment> CsvExtractor::extract(const fs::path &file_path) const {
  const std::string content = get_string_content(file_path);
  std::vector<std::vector<std::string>> records = parse_records(content);
  if (records.empty()) {
    return {};
  }

  const std::vector<std::string> &header = records.front();
  const Metadata base = base_metadata(file_path, content);

  std::vector<RawSegment> segments;
  segments.reserve(records.size() - 1);
  for (size_t row = 1; row < records.size(); ++row) {
    const auto &record = records[row];
    if (record.size() != header.size()) {
      throw DocumentUnreadable(file_path.string() + ": data row " + std::to_string(row - 1) +
                               " has " + std::to_string(record.size()) + " fields, header has " +
                               std::to_string(header.size()));
    }

    RawSegment segment;
    for (size_t col = 0; col < header.size(); ++col) {
      if (col > 0) {
        segment.text += '\n';
      }
      segment.text += header[col] + ": " + record[col];
    }
    segment.source_metadata = base;
    segment.source_metadata[ROW_FIELD] = std::to_string(row - 1);
    segments.push_back(std::move(segment));
  }
  return segments;
}

}  // namespace ragline_core
