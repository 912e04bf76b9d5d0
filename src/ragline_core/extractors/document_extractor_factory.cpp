#include "ragline_core/extractors/document_extractor_factory.hpp"

#include "ragline_core/errors.hpp"
#include "ragline_core/extractors/csv_extractor.hpp"
#include "ragline_core/extractors/plaintext_extractor.hpp"

namespace ragline_core {

DocumentExtractorFactory::DocumentExtractorFactory() {
  extractors.push_back(std::make_unique<CsvExtractor>());
  extractors.push_back(std::make_unique<PlainTextExtractor>());
}

const DocumentExtractor &DocumentExtractorFactory::get_extractor_for(
    const std::filesystem::path &file_path) const {
  if (!std::filesystem::is_regular_file(file_path)) {
    throw DocumentUnreadable("File not found: " + file_path.string());
  }
  for (const auto &extractor : extractors) {
    if (extractor->can_handle(file_path)) {
      return *extractor;
    }
  }
  throw DocumentUnreadable("No suitable document extractor found for " + file_path.string());
}

}  // namespace ragline_core
