#pragma once

#include <atomic>
#include <filesystem>
#include <memory>
#include <vector>

#include "ragline_core/extractors/document_extractor_factory.hpp"
#include "ragline_core/fragmenter.hpp"
#include "ragline_core/index/vector_index.hpp"
#include "ragline_core/services/embedder_adapter.hpp"

namespace ragline_core {

// Shared flag a caller flips to abandon an ingestion between batches.
class CancellationToken {
 public:
  CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

  void cancel() const {
    flag_->store(true);
  }
  bool is_cancelled() const {
    return flag_->load();
  }

 private:
  std::shared_ptr<std::atomic<bool>> flag_;
};

struct IngestionOptions {
  int chunk_size = 1000;
  int chunk_overlap = 200;
  size_t batch_size = 32;
  // Batches embedded concurrently; commits still happen in batch order.
  size_t parallel_batches = 1;
  IndexKind index_kind = IndexKind::Flat;
  Metric metric = Metric::Cosine;
};

struct IngestionReport {
  size_t requested = 0;
  size_t completed = 0;
  std::vector<FragmentId> ids;
};

struct IngestionResult {
  std::shared_ptr<VectorIndex> index;
  IngestionReport report;
};

/**
 * @class IngestionPipeline
 * @brief Fragmenter -> EmbedderAdapter -> VectorIndex.
 *
 * Fragments are embedded in batches of batch_size and each batch is committed
 * to the index as soon as it (and every batch before it) has been embedded.
 * When a batch fails, the batches already committed stay in the index and the
 * failure is reported as an IngestionError with completed/requested counts;
 * nothing after the failed batch is committed.
 */
class IngestionPipeline {
 public:
  /**
   * @throw InvalidConfiguration for bad chunk parameters, a zero batch size or
   *        zero parallel batches.
   */
  IngestionPipeline(std::shared_ptr<EmbedderAdapter> embedder,
                    IngestionOptions options = {},
                    std::shared_ptr<const DocumentExtractorFactory> extractors = nullptr);
  virtual ~IngestionPipeline() = default;

  // Builds a new index sized from the embedder's probed dimension.
  virtual IngestionResult ingest(const std::vector<RawSegment> &segments,
                                 const CancellationToken &token = CancellationToken());

  // Same as ingest() with one-off chunk parameters.
  IngestionResult ingest(const std::vector<RawSegment> &segments,
                         int chunk_size,
                         int chunk_overlap,
                         const CancellationToken &token = CancellationToken());

  // Extracts the file, then ingests its segments. Parse failures are reported
  // as IngestionError at the Parsing stage.
  virtual IngestionResult ingest_document(const std::filesystem::path &path,
                                          const CancellationToken &token = CancellationToken());

  // Appends to an existing index.
  IngestionReport ingest_into(const std::shared_ptr<VectorIndex> &index,
                              const std::vector<RawSegment> &segments,
                              const CancellationToken &token = CancellationToken());

  const IngestionOptions &options() const {
    return options_;
  }

 private:
  std::shared_ptr<EmbedderAdapter> embedder_;
  IngestionOptions options_;
  Fragmenter fragmenter_;
  std::shared_ptr<const DocumentExtractorFactory> extractors_;

  IngestionReport index_fragments(const std::shared_ptr<VectorIndex> &index,
                                  std::vector<Fragment> fragments,
                                  const CancellationToken &token);
};

}  // namespace ragline_core
