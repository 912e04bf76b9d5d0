#include "ragline_core/services/retriever.hpp"

#include <stdexcept>

#include "ragline_core/errors.hpp"

namespace ragline_core {

Retriever::Retriever(std::shared_ptr<const VectorIndex> index,
                     std::shared_ptr<EmbedderAdapter> embedder,
                     int default_k)
    : index_(std::move(index)), embedder_(std::move(embedder)), default_k_(default_k) {
  if (!index_ || !embedder_) {
    throw InvalidConfiguration("Retriever requires an index and an embedder");
  }
  if (default_k_ <= 0) {
    throw InvalidConfiguration("Retriever default k must be greater than 0");
  }
}

RetrievalResult Retriever::retrieve(const std::string &query_text) const {
  return retrieve(query_text, default_k_);
}

RetrievalResult Retriever::retrieve(const std::string &query_text, int k) const {
  if (k <= 0) {
    throw std::invalid_argument("k must be greater than 0, got " + std::to_string(k));
  }
  std::vector<float> query_vector = embedder_->embed_one(query_text);
  return index_->query(query_vector, k);
}

RetrievalResult Retriever::retrieve(const std::string &query_text,
                                    int k,
                                    const MetadataFilter &filter) const {
  RetrievalResult ranked = retrieve(query_text, k);
  if (filter.empty()) {
    return ranked;
  }
  RetrievalResult kept;
  kept.reserve(ranked.size());
  for (auto &hit : ranked) {
    if (filter.matches(hit.fragment.source_metadata)) {
      kept.push_back(std::move(hit));
    }
  }
  return kept;
}

}  // namespace ragline_core
