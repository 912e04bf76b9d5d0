#pragma once

#include <memory>
#include <string>

#include "ragline_core/index/vector_index.hpp"
#include "ragline_core/services/embedder_adapter.hpp"
#include "ragline_core/services/metadata_filter.hpp"

namespace ragline_core {

/**
 * @class Retriever
 * @brief Turns a question into ranked fragments: embed_one, then index query.
 *
 * Failures from the embedder (EmbeddingUnavailable) and the index
 * (DimensionMismatch, EmptyIndex) propagate unchanged. Filtering happens after
 * ranking, so a filtered retrieval can return fewer than k fragments.
 */
class Retriever {
 public:
  static constexpr int DEFAULT_TOP_K = 4;

  Retriever(std::shared_ptr<const VectorIndex> index,
            std::shared_ptr<EmbedderAdapter> embedder,
            int default_k = DEFAULT_TOP_K);
  virtual ~Retriever() = default;

  virtual RetrievalResult retrieve(const std::string &query_text, int k) const;
  virtual RetrievalResult retrieve(const std::string &query_text,
                                   int k,
                                   const MetadataFilter &filter) const;
  RetrievalResult retrieve(const std::string &query_text) const;

  int default_k() const {
    return default_k_;
  }
  const VectorIndex &index() const {
    return *index_;
  }

 private:
  std::shared_ptr<const VectorIndex> index_;
  std::shared_ptr<EmbedderAdapter> embedder_;
  int default_k_;
};

}  // namespace ragline_core
