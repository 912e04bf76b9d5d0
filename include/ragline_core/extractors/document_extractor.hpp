#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "ragline_core/types/document.hpp"
#include "ragline_core/types/fragment.hpp"

namespace fs = std::filesystem;

namespace ragline_core {

class DocumentExtractor {
 public:
  static constexpr const char *SOURCE_FIELD = "source";
  static constexpr const char *CONTENT_HASH_FIELD = "content_hash";

  virtual ~DocumentExtractor() = default;

  // Checks if this extractor can handle the given file extension
  virtual bool can_handle(const fs::path &file_path) const = 0;

  /**
   * @brief Opens, reads and splits the file into ordered segments.
   * @throw DocumentUnreadable if the file cannot be opened or parsed.
   */
  virtual std::vector<RawSegment> extract(const fs::path &file_path) const = 0;

  virtual DocumentType get_document_type() const = 0;

 protected:
  std::string get_string_content(const fs::path &file_path) const;
  std::string compute_hash_from_content(const std::string &content) const;
  // source and content_hash, shared by every segment of one file.
  Metadata base_metadata(const fs::path &file_path, const std::string &content) const;
};

using DocumentExtractorPtr = std::unique_ptr<DocumentExtractor>;

}  // namespace ragline_core
