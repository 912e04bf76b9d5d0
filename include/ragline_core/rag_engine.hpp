#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "ragline_core/errors.hpp"
#include "ragline_core/llm/provider.hpp"
#include "ragline_core/services/answering_pipeline.hpp"
#include "ragline_core/services/embedder_adapter.hpp"
#include "ragline_core/services/ingestion_pipeline.hpp"
#include "ragline_core/services/metadata_filter.hpp"

namespace ragline_core {

using IndexHandle = std::string;

struct RagEngineOptions {
  IngestionOptions ingestion;
  AnsweringOptions answering;
  RetryPolicy retry;
};

struct IndexSummary {
  IndexHandle handle;
  IndexKind kind;
  Metric metric;
  size_t dimension;
  size_t size;
  // File path, "segments" or "adopted"; " (partial)" is appended for salvaged ingestions.
  std::string origin;
};

// An ingestion that failed after committing some batches. The committed part
// is already registered under handle().
class PartialIngestionError : public IngestionError {
 public:
  PartialIngestionError(const IngestionError &cause, IndexHandle handle)
      : IngestionError(cause), handle_(std::move(handle)) {}

  const IndexHandle &handle() const noexcept {
    return handle_;
  }

 private:
  IndexHandle handle_;
};

/**
 * @class RagEngine
 * @brief Registry of live indexes plus the pipelines that build and read them.
 *
 * Handles are opaque strings handed out on ingest/load; an unknown handle is
 * std::out_of_range. An ingestion that fails after committing at least one
 * batch still registers what it committed and throws PartialIngestionError
 * naming the handle. Nothing is registered when no batch was committed.
 */
class RagEngine {
 public:
  RagEngine(std::shared_ptr<EmbeddingProvider> embeddings,
            std::shared_ptr<GenerationProvider> generator,
            RagEngineOptions options = {});

  RagEngine(const RagEngine &) = delete;
  RagEngine &operator=(const RagEngine &) = delete;

  IndexHandle ingest(const std::filesystem::path &path,
                     const CancellationToken &token = CancellationToken());
  IndexHandle ingest(const std::vector<RawSegment> &segments,
                     const CancellationToken &token = CancellationToken());

  IndexHandle adopt(std::shared_ptr<VectorIndex> index);

  RetrievalResult query(const IndexHandle &handle,
                        const std::string &question,
                        int k,
                        const MetadataFilter &filter = MetadataFilter()) const;

  AnswerResult answer(const IndexHandle &handle,
                      const std::string &question,
                      const MetadataFilter &filter = MetadataFilter()) const;

  void save(const IndexHandle &handle, const std::filesystem::path &path) const;

  // The stored index must match the embedder's dimension and the configured
  // metric, otherwise IncompatibleIndex.
  IndexHandle load(const std::filesystem::path &path);

  // Drops the index from the registry. Callers holding it keep their reference.
  void unload(const IndexHandle &handle);

  std::vector<IndexSummary> list() const;

  std::shared_ptr<VectorIndex> get(const IndexHandle &handle) const;

  const RagEngineOptions &options() const {
    return options_;
  }

 private:
  struct RegisteredIndex {
    std::shared_ptr<VectorIndex> index;
    std::string origin;
  };

  std::shared_ptr<EmbedderAdapter> embedder_;
  std::shared_ptr<GenerationProvider> generator_;
  RagEngineOptions options_;
  IngestionPipeline ingestion_;

  mutable std::mutex registry_mutex_;
  std::map<IndexHandle, RegisteredIndex> registry_;
  size_t next_handle_ = 1;

  IndexHandle register_index(std::shared_ptr<VectorIndex> index, std::string origin);

  template <typename Ingest>
  IndexHandle ingest_and_register(Ingest &&ingest, const std::string &origin);
};

}  // namespace ragline_core
