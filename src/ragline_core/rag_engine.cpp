#include "ragline_core/rag_engine.hpp"

#include <iostream>
#include <stdexcept>

#include "ragline_core/db/index_repository.hpp"
#include "ragline_core/errors.hpp"
#include "ragline_core/services/retriever.hpp"

namespace ragline_core {

RagEngine::RagEngine(std::shared_ptr<EmbeddingProvider> embeddings,
                     std::shared_ptr<GenerationProvider> generator,
                     RagEngineOptions options)
    : embedder_(std::make_shared<EmbedderAdapter>(std::move(embeddings), options.retry)),
      generator_(std::move(generator)),
      options_(std::move(options)),
      ingestion_(embedder_, options_.ingestion) {
  if (!generator_) {
    throw InvalidConfiguration("RagEngine requires a generation provider");
  }
}

IndexHandle RagEngine::register_index(std::shared_ptr<VectorIndex> index, std::string origin) {
  std::lock_guard<std::mutex> lock(registry_mutex_);
  IndexHandle handle = "idx-" + std::to_string(next_handle_++);
  registry_.emplace(handle, RegisteredIndex{std::move(index), std::move(origin)});
  return handle;
}

template <typename Ingest>
IndexHandle RagEngine::ingest_and_register(Ingest &&ingest, const std::string &origin) {
  IngestionResult result;
  try {
    result = ingest();
  } catch (const IngestionError &e) {
    if (!e.partial_index() || e.completed() == 0) {
      throw;
    }
    IndexHandle handle = register_index(e.partial_index(), origin + " (partial)");
    std::cerr << "Registered " << handle << " with " << e.completed() << " of " << e.requested()
              << " fragments from a failed ingestion of " << origin << std::endl;
    throw PartialIngestionError(e, handle);
  }
  IndexHandle handle = register_index(result.index, origin);
  std::cout << "Registered " << handle << " with " << result.report.completed
            << " fragments from " << origin << std::endl;
  return handle;
}

IndexHandle RagEngine::ingest(const std::filesystem::path &path, const CancellationToken &token) {
  return ingest_and_register([&] { return ingestion_.ingest_document(path, token); },
                             path.string());
}

IndexHandle RagEngine::ingest(const std::vector<RawSegment> &segments,
                              const CancellationToken &token) {
  return ingest_and_register([&] { return ingestion_.ingest(segments, token); }, "segments");
}

IndexHandle RagEngine::adopt(std::shared_ptr<VectorIndex> index) {
  if (!index) {
    throw std::invalid_argument("Cannot adopt a null index");
  }
  return register_index(std::move(index), "adopted");
}

std::shared_ptr<VectorIndex> RagEngine::get(const IndexHandle &handle) const {
  std::lock_guard<std::mutex> lock(registry_mutex_);
  auto it = registry_.find(handle);
  if (it == registry_.end()) {
    throw std::out_of_range("Unknown index handle: " + handle);
  }
  return it->second.index;
}

RetrievalResult RagEngine::query(const IndexHandle &handle,
                                 const std::string &question,
                                 int k,
                                 const MetadataFilter &filter) const {
  Retriever retriever(get(handle), embedder_, options_.answering.top_k);
  return retriever.retrieve(question, k, filter);
}

AnswerResult RagEngine::answer(const IndexHandle &handle,
                               const std::string &question,
                               const MetadataFilter &filter) const {
  auto retriever = std::make_shared<Retriever>(get(handle), embedder_, options_.answering.top_k);
  AnsweringPipeline pipeline(retriever, generator_, options_.answering);
  return pipeline.answer_with_sources(question, filter);
}

void RagEngine::save(const IndexHandle &handle, const std::filesystem::path &path) const {
  IndexRepository::save(*get(handle), path);
}

IndexHandle RagEngine::load(const std::filesystem::path &path) {
  std::shared_ptr<VectorIndex> index =
      IndexRepository::load(path, embedder_->dimension(), options_.ingestion.metric);
  return register_index(std::move(index), path.string());
}

void RagEngine::unload(const IndexHandle &handle) {
  std::lock_guard<std::mutex> lock(registry_mutex_);
  if (registry_.erase(handle) == 0) {
    throw std::out_of_range("Unknown index handle: " + handle);
  }
  std::cout << "Unloaded " << handle << std::endl;
}

std::vector<IndexSummary> RagEngine::list() const {
  std::lock_guard<std::mutex> lock(registry_mutex_);
  std::vector<IndexSummary> summaries;
  summaries.reserve(registry_.size());
  for (const auto &[handle, registered] : registry_) {
    const VectorIndex &index = *registered.index;
    summaries.push_back(IndexSummary{handle, index.kind(), index.metric(), index.dimension(),
                                     index.size(), registered.origin});
  }
  return summaries;
}

}  // namespace ragline_core
