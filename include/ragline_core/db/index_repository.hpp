#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>

#include "ragline_core/index/vector_index.hpp"

namespace ragline_core {

class IndexRepositoryError : public std::exception {
 public:
  explicit IndexRepositoryError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

struct StoredIndexInfo {
  int format_version = 0;
  size_t dimension = 0;
  Metric metric = Metric::L2;
  IndexKind kind = IndexKind::Flat;
  size_t entry_count = 0;
  std::chrono::system_clock::time_point created_at;
};

/**
 * @class IndexRepository
 * @brief Saves and reloads vector indexes as SQLite files.
 *
 * A file holds one index: its dimension, metric and backend, plus every entry
 * (id, embedding, zstd-compressed text, metadata as JSON) in insertion order.
 */
class IndexRepository {
 public:
  static constexpr int FORMAT_VERSION = 1;

  /**
   * @brief Writes the index to path, replacing any existing file.
   *
   * The file is written next to the target and renamed into place once the
   * transaction commits, so readers never see a half-written index.
   * @throw IndexRepositoryError on SQLite or filesystem failures.
   */
  static void save(const VectorIndex &index, const std::filesystem::path &path);

  /**
   * @throw IndexRepositoryError if the file is missing or unreadable.
   * @throw IncompatibleIndex if it is not a ragline index file.
   */
  static StoredIndexInfo read_info(const std::filesystem::path &path);

  // Recreates the index with the backend, dimension and metric stored in the file.
  static std::shared_ptr<VectorIndex> load(const std::filesystem::path &path);

  // As load(), but rejects a file whose dimension or metric differ from the expected ones.
  static std::shared_ptr<VectorIndex> load(const std::filesystem::path &path,
                                           size_t expected_dimension,
                                           Metric expected_metric);

  /**
   * @brief Appends the stored entries to an existing index.
   * @throw IncompatibleIndex if the stored dimension or metric differ from the
   *        target's; the target is left untouched.
   */
  static void load_into(const std::filesystem::path &path, VectorIndex &index);

 private:
  static std::string time_point_to_string(const std::chrono::system_clock::time_point &tp);
  static std::chrono::system_clock::time_point string_to_time_point(const std::string &time_str);
};

}  // namespace ragline_core
