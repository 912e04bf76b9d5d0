#pragma once
#include <filesystem>
#include <memory>
#include <vector>

#include "document_extractor.hpp"

namespace ragline_core {

/**
 * @class DocumentExtractorFactory
 * @brief Selects the DocumentExtractor for a file based on its extension.
 *
 * Non-copyable and non-movable; extractors are created once in the constructor.
 */
class DocumentExtractorFactory {
 public:
  DocumentExtractorFactory();
  virtual ~DocumentExtractorFactory() = default;

  /**
   * @brief Returns the first registered extractor that can handle the file.
   * @throw DocumentUnreadable if the file does not exist or no extractor matches.
   */
  virtual const DocumentExtractor &get_extractor_for(const std::filesystem::path &file_path) const;

  DocumentExtractorFactory(const DocumentExtractorFactory &) = delete;
  DocumentExtractorFactory &operator=(const DocumentExtractorFactory &) = delete;
  DocumentExtractorFactory(DocumentExtractorFactory &&) = delete;
  DocumentExtractorFactory &operator=(DocumentExtractorFactory &&) = delete;

 private:
  std::vector<DocumentExtractorPtr> extractors;
};

}  // namespace ragline_core
