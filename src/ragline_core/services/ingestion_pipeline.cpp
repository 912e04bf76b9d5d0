#include "ragline_core/services/ingestion_pipeline.hpp"

#include <algorithm>
#include <deque>
#include <future>
#include <iostream>
#include <string>

#include "ragline_core/errors.hpp"

namespace ragline_core {

IngestionPipeline::IngestionPipeline(std::shared_ptr<EmbedderAdapter> embedder,
                                     IngestionOptions options,
                                     std::shared_ptr<const DocumentExtractorFactory> extractors)
    : embedder_(std::move(embedder)),
      options_(options),
      fragmenter_(options.chunk_size, options.chunk_overlap),
      extractors_(std::move(extractors)) {
  if (!embedder_) {
    throw InvalidConfiguration("IngestionPipeline requires an embedder");
  }
  if (options_.batch_size == 0) {
    throw InvalidConfiguration("batch_size must be greater than 0");
  }
  if (options_.parallel_batches == 0) {
    throw InvalidConfiguration("parallel_batches must be greater than 0");
  }
  if (!extractors_) {
    extractors_ = std::make_shared<DocumentExtractorFactory>();
  }
}

IngestionResult IngestionPipeline::ingest(const std::vector<RawSegment> &segments,
                                          int chunk_size,
                                          int chunk_overlap,
                                          const CancellationToken &token) {
  IngestionOptions options = options_;
  options.chunk_size = chunk_size;
  options.chunk_overlap = chunk_overlap;
  IngestionPipeline one_off(embedder_, options, extractors_);
  return one_off.ingest(segments, token);
}

IngestionResult IngestionPipeline::ingest(const std::vector<RawSegment> &segments,
                                          const CancellationToken &token) {
  std::vector<Fragment> fragments = fragmenter_.split(segments);
  const size_t requested = fragments.size();

  size_t dimension = 0;
  try {
    dimension = embedder_->dimension();
  } catch (const RaglineError &e) {
    throw IngestionError(IngestionStage::Embedding, e.kind(), e.what(), 0, requested);
  }

  std::shared_ptr<VectorIndex> index =
      make_vector_index(options_.index_kind, dimension, options_.metric);
  IngestionReport report = index_fragments(index, std::move(fragments), token);
  return {index, std::move(report)};
}

IngestionResult IngestionPipeline::ingest_document(const std::filesystem::path &path,
                                                   const CancellationToken &token) {
  std::vector<RawSegment> segments;
  DocumentType type = DocumentType::Unknown;
  try {
    const DocumentExtractor &extractor = extractors_->get_extractor_for(path);
    type = extractor.get_document_type();
    segments = extractor.extract(path);
  } catch (const RaglineError &e) {
    throw IngestionError(IngestionStage::Parsing, e.kind(), e.what(), 0, 0);
  } catch (const std::exception &e) {
    throw IngestionError(IngestionStage::Parsing, ErrorKind::DocumentUnreadable, e.what(), 0, 0);
  }
  std::cout << "Extracted " << segments.size() << " segments from " << to_string(type)
            << " document " << path << std::endl;
  return ingest(segments, token);
}

IngestionReport IngestionPipeline::ingest_into(const std::shared_ptr<VectorIndex> &index,
                                               const std::vector<RawSegment> &segments,
                                               const CancellationToken &token) {
  if (!index) {
    throw InvalidConfiguration("ingest_into requires an index");
  }
  std::vector<Fragment> fragments = fragmenter_.split(segments);
  const size_t requested = fragments.size();

  size_t dimension = 0;
  try {
    dimension = embedder_->dimension();
  } catch (const RaglineError &e) {
    throw IngestionError(IngestionStage::Embedding, e.kind(), e.what(), 0, requested, index);
  }
  if (dimension != index->dimension()) {
    DimensionMismatch mismatch(index->dimension(), dimension);
    throw IngestionError(IngestionStage::Indexing, mismatch.kind(), mismatch.what(), 0, requested,
                         index);
  }
  return index_fragments(index, std::move(fragments), token);
}

IngestionReport IngestionPipeline::index_fragments(const std::shared_ptr<VectorIndex> &index,
                                                   std::vector<Fragment> fragments,
                                                   const CancellationToken &token) {
  IngestionReport report;
  report.requested = fragments.size();
  if (fragments.empty()) {
    return report;
  }

  const size_t batch_size = options_.batch_size;
  const size_t num_batches = (fragments.size() + batch_size - 1) / batch_size;
  // A single lane runs each batch lazily on get(), keeping ingestion sequential.
  const std::launch policy =
      options_.parallel_batches > 1 ? std::launch::async : std::launch::deferred;

  auto batch_texts = [&fragments, batch_size](size_t batch) {
    const size_t begin = batch * batch_size;
    const size_t end = std::min(begin + batch_size, fragments.size());
    std::vector<std::string> texts;
    texts.reserve(end - begin);
    for (size_t i = begin; i < end; ++i) {
      texts.push_back(fragments[i].text);
    }
    return texts;
  };

  std::deque<std::future<std::vector<std::vector<float>>>> in_flight;
  size_t next_to_launch = 0;

  for (size_t batch = 0; batch < num_batches; ++batch) {
    while (next_to_launch < num_batches && next_to_launch < batch + options_.parallel_batches &&
           !token.is_cancelled()) {
      in_flight.push_back(std::async(
          policy, [this, texts = batch_texts(next_to_launch)] { return embedder_->embed_batch(texts); }));
      ++next_to_launch;
    }

    if (token.is_cancelled() || in_flight.empty()) {
      std::cerr << "Ingestion cancelled after " << report.completed << " of " << report.requested
                << " fragments" << std::endl;
      throw IngestionError(IngestionStage::Embedding, ErrorKind::Cancelled,
                           "Ingestion cancelled by caller", report.completed, report.requested,
                           index);
    }

    std::vector<std::vector<float>> vectors;
    try {
      vectors = in_flight.front().get();
    } catch (const RaglineError &e) {
      std::cerr << "Embedding batch " << batch + 1 << " of " << num_batches
                << " failed: " << e.what() << std::endl;
      throw IngestionError(IngestionStage::Embedding, e.kind(), e.what(), report.completed,
                           report.requested, index);
    } catch (const std::exception &e) {
      std::cerr << "Embedding batch " << batch + 1 << " of " << num_batches
                << " failed: " << e.what() << std::endl;
      throw IngestionError(IngestionStage::Embedding, ErrorKind::EmbeddingUnavailable, e.what(),
                           report.completed, report.requested, index);
    }
    in_flight.pop_front();

    // The batch may have finished after the caller gave up.
    if (token.is_cancelled()) {
      throw IngestionError(IngestionStage::Embedding, ErrorKind::Cancelled,
                           "Ingestion cancelled by caller", report.completed, report.requested,
                           index);
    }

    const size_t begin = batch * batch_size;
    std::vector<VectorIndexEntry> entries;
    entries.reserve(vectors.size());
    for (size_t i = 0; i < vectors.size(); ++i) {
      Fragment &fragment = fragments[begin + i];
      entries.push_back({kUnassignedFragmentId, std::move(vectors[i]), std::move(fragment)});
    }

    std::vector<FragmentId> ids;
    try {
      ids = index->insert(std::move(entries));
    } catch (const RaglineError &e) {
      throw IngestionError(IngestionStage::Indexing, e.kind(), e.what(), report.completed,
                           report.requested, index);
    } catch (const std::exception &e) {
      std::cerr << "Indexing batch " << batch + 1 << " of " << num_batches
                << " failed: " << e.what() << std::endl;
      throw IngestionError(IngestionStage::Indexing, ErrorKind::IndexFailure, e.what(),
                           report.completed, report.requested, index);
    }
    report.completed += ids.size();
    report.ids.insert(report.ids.end(), ids.begin(), ids.end());
    std::cout << "Indexed batch " << batch + 1 << " of " << num_batches << " ("
              << report.completed << "/" << report.requested << " fragments)" << std::endl;
  }

  return report;
}

}  // namespace ragline_core
