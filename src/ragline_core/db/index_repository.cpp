#include "ragline_core/db/index_repository.hpp"

#include <sqlite_modern_cpp.h>

#include <cstring>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <nlohmann/json.hpp>
#include <sstream>

#include "ragline_core/db/sqlite_error_utils.hpp"
#include "ragline_core/db/transaction.hpp"
#include "ragline_core/errors.hpp"
#include "ragline_core/services/compression_service.hpp"

namespace ragline_core {

namespace {

void setup_schema(sqlite::database &db) {
  db << R"(
      CREATE TABLE IF NOT EXISTS index_info (
          id INTEGER PRIMARY KEY CHECK (id = 1),
          format_version INTEGER NOT NULL,
          dimension INTEGER NOT NULL,
          metric TEXT NOT NULL,
          backend TEXT NOT NULL,
          created_at TEXT NOT NULL
      )
    )";

  // seq preserves insertion order
  db << R"(
      CREATE TABLE IF NOT EXISTS entries (
          seq INTEGER PRIMARY KEY,
          fragment_id INTEGER UNIQUE NOT NULL,
          embedding BLOB NOT NULL,
          content BLOB,
          metadata TEXT NOT NULL
      )
    )";
}

std::vector<char> vector_to_blob(const std::vector<float> &vector) {
  std::vector<char> blob(vector.size() * sizeof(float));
  std::memcpy(blob.data(), vector.data(), blob.size());
  return blob;
}

std::vector<float> blob_to_vector(const std::vector<char> &blob) {
  std::vector<float> vector(blob.size() / sizeof(float));
  std::memcpy(vector.data(), blob.data(), vector.size() * sizeof(float));
  return vector;
}

std::unique_ptr<sqlite::database> open_read_only(const std::filesystem::path &path) {
  if (!std::filesystem::is_regular_file(path)) {
    throw IndexRepositoryError("No index file at " + path.string());
  }
  sqlite::sqlite_config config;
  config.flags = sqlite::OpenFlags::READONLY;
  try {
    return std::make_unique<sqlite::database>(path.string(), config);
  } catch (const sqlite::sqlite_exception &e) {
    throw IndexRepositoryError(describe_storage_error("open index file", e));
  }
}

}  // namespace

std::string IndexRepository::time_point_to_string(const std::chrono::system_clock::time_point &tp) {
  auto time_t = std::chrono::system_clock::to_time_t(tp);
  std::stringstream ss;
  ss << std::put_time(std::gmtime(&time_t), "%Y-%m-%d %H:%M:%S");
  return ss.str();
}

std::chrono::system_clock::time_point IndexRepository::string_to_time_point(
    const std::string &time_str) {
  std::tm tm_struct = {};
  std::stringstream ss(time_str);
  ss >> std::get_time(&tm_struct, "%Y-%m-%d %H:%M:%S");
  if (ss.fail()) {
    throw IncompatibleIndex("Failed to parse created_at: " + time_str +
                            ". Expected format YYYY-MM-DD HH:MM:SS.");
  }
  // We stored GMT time.
  return std::chrono::system_clock::from_time_t(timegm(&tm_struct));
}

void IndexRepository::save(const VectorIndex &index, const std::filesystem::path &path) {
  const std::vector<Fragment> fragments = index.entries();
  std::filesystem::path temp_path = path;
  temp_path += ".tmp";

  try {
    if (path.has_parent_path()) {
      std::filesystem::create_directories(path.parent_path());
    }
    std::filesystem::remove(temp_path);

    {
      sqlite::database db(temp_path.string());
      setup_schema(db);
      WriteTransaction tx(db);
      db << "INSERT INTO index_info (id, format_version, dimension, metric, backend, created_at) "
            "VALUES (1, ?, ?, ?, ?, ?)"
         << FORMAT_VERSION << static_cast<int64_t>(index.dimension()) << to_string(index.metric())
         << to_string(index.kind()) << time_point_to_string(std::chrono::system_clock::now());

      auto insert = db << "INSERT INTO entries (seq, fragment_id, embedding, content, metadata) "
                          "VALUES (?, ?, ?, ?, ?)";
      int64_t seq = 0;
      for (const auto &fragment : fragments) {
        nlohmann::json metadata_json = fragment.source_metadata;
        insert << seq++ << static_cast<int64_t>(fragment.id) << vector_to_blob(fragment.embedding)
               << CompressionService::compress(fragment.text) << metadata_json.dump();
        insert++;
      }
      tx.commit();
    }

    std::filesystem::rename(temp_path, path);
  } catch (const sqlite::sqlite_exception &e) {
    std::filesystem::remove(temp_path);
    throw IndexRepositoryError(describe_storage_error("save index", e));
  } catch (const std::filesystem::filesystem_error &e) {
    throw IndexRepositoryError("save index failed: " + std::string(e.what()));
  } catch (const CompressionError &e) {
    std::filesystem::remove(temp_path);
    throw IndexRepositoryError("save index failed: " + std::string(e.what()));
  }
  std::cout << "Saved " << fragments.size() << " entries to " << path << std::endl;
}

StoredIndexInfo IndexRepository::read_info(const std::filesystem::path &path) {
  auto db = open_read_only(path);
  StoredIndexInfo info;
  bool found = false;
  try {
    *db << "SELECT format_version, dimension, metric, backend, created_at FROM index_info "
           "WHERE id = 1" >>
        [&](int format_version, int64_t dimension, std::string metric, std::string backend,
            std::string created_at) {
          info.format_version = format_version;
          info.dimension = static_cast<size_t>(dimension);
          info.metric = metric_from_string(metric);
          info.kind = index_kind_from_string(backend);
          info.created_at = string_to_time_point(created_at);
          found = true;
        };
    *db << "SELECT count(*) FROM entries" >> [&](int64_t count) {
      info.entry_count = static_cast<size_t>(count);
    };
  } catch (const sqlite::sqlite_exception &e) {
    if (is_foreign_file(e)) {
      throw IncompatibleIndex(path.string() + " is not a ragline index: " + e.what());
    }
    throw IndexRepositoryError(describe_storage_error("read index info", e));
  } catch (const InvalidConfiguration &e) {
    throw IncompatibleIndex(path.string() + " has an unsupported configuration: " + e.what());
  }

  if (!found) {
    throw IncompatibleIndex(path.string() + " has no index_info row");
  }
  if (info.format_version != FORMAT_VERSION) {
    throw IncompatibleIndex(path.string() + " uses format version " +
                            std::to_string(info.format_version) + ", expected " +
                            std::to_string(FORMAT_VERSION));
  }
  return info;
}

std::shared_ptr<VectorIndex> IndexRepository::load(const std::filesystem::path &path) {
  const StoredIndexInfo info = read_info(path);
  std::shared_ptr<VectorIndex> index = make_vector_index(info.kind, info.dimension, info.metric);
  load_into(path, *index);
  return index;
}

std::shared_ptr<VectorIndex> IndexRepository::load(const std::filesystem::path &path,
                                                   size_t expected_dimension,
                                                   Metric expected_metric) {
  const StoredIndexInfo info = read_info(path);
  std::shared_ptr<VectorIndex> index =
      make_vector_index(info.kind, expected_dimension, expected_metric);
  load_into(path, *index);
  return index;
}

void IndexRepository::load_into(const std::filesystem::path &path, VectorIndex &index) {
  const StoredIndexInfo info = read_info(path);
  if (info.dimension != index.dimension()) {
    throw IncompatibleIndex("Stored index has dimension " + std::to_string(info.dimension) +
                            ", target index has " + std::to_string(index.dimension()));
  }
  if (info.metric != index.metric()) {
    throw IncompatibleIndex("Stored index uses metric " + to_string(info.metric) +
                            ", target index uses " + to_string(index.metric()));
  }

  std::vector<VectorIndexEntry> entries;
  entries.reserve(info.entry_count);
  auto db = open_read_only(path);
  try {
    *db << "SELECT fragment_id, embedding, content, metadata FROM entries ORDER BY seq" >>
        [&](int64_t fragment_id, std::vector<char> embedding_blob, std::vector<char> content,
            std::string metadata) {
          if (embedding_blob.size() != info.dimension * sizeof(float)) {
            throw IncompatibleIndex("Entry " + std::to_string(fragment_id) + " has a " +
                                    std::to_string(embedding_blob.size()) +
                                    "-byte embedding, expected " +
                                    std::to_string(info.dimension * sizeof(float)));
          }
          VectorIndexEntry entry;
          entry.fragment_id = static_cast<FragmentId>(fragment_id);
          entry.embedding = blob_to_vector(embedding_blob);
          entry.payload.text = CompressionService::decompress(content);
          entry.payload.source_metadata = nlohmann::json::parse(metadata).get<Metadata>();
          entries.push_back(std::move(entry));
        };
  } catch (const sqlite::sqlite_exception &e) {
    throw IndexRepositoryError(describe_storage_error("load index entries", e));
  } catch (const nlohmann::json::exception &e) {
    throw IncompatibleIndex("Corrupt entry metadata in " + path.string() + ": " + e.what());
  } catch (const CompressionError &e) {
    throw IncompatibleIndex("Corrupt entry text in " + path.string() + ": " + e.what());
  }

  index.insert(std::move(entries));
  std::cout << "Loaded " << info.entry_count << " entries from " << path << std::endl;
}

}  // namespace ragline_core
