#pragma once

#include <faiss/IndexHNSW.h>
#include <faiss/IndexIDMap.h>

#include <memory>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

#include "ragline_core/index/vector_index.hpp"

namespace ragline_core {

/**
 * @class HnswVectorIndex
 * @brief Approximate index backed by a Faiss HNSW graph.
 *
 * Same contract as FlatVectorIndex except that results are approximate and
 * equidistant entries come back in graph order rather than insertion order.
 * Cosine is served by L2-normalizing every vector and searching by inner product.
 */
class HnswVectorIndex : public VectorIndex {
 public:
  HnswVectorIndex(size_t dimension, Metric metric);
  ~HnswVectorIndex() override;

  HnswVectorIndex(const HnswVectorIndex &) = delete;
  HnswVectorIndex &operator=(const HnswVectorIndex &) = delete;

  size_t dimension() const override {
    return dimension_;
  }
  Metric metric() const override {
    return metric_;
  }
  IndexKind kind() const override {
    return IndexKind::Hnsw;
  }
  size_t size() const override;

  std::vector<FragmentId> insert(std::vector<VectorIndexEntry> entries) override;
  RetrievalResult query(const std::vector<float> &vector, int k) const override;
  std::vector<Fragment> entries() const override;

 private:
  // Faiss Index Parameters
  static constexpr int HNSW_M_PARAM = 32;
  static constexpr int HNSW_EF_CONSTRUCTION_PARAM = 100;
  static constexpr int HNSW_EF_SEARCH_PARAM = 64;

  size_t dimension_;
  Metric metric_;

  mutable std::shared_mutex mutex_;
  // Declared before id_map_ so it outlives the wrapper.
  std::unique_ptr<faiss::IndexHNSWFlat> base_index_;
  std::unique_ptr<faiss::IndexIDMap> id_map_;
  std::vector<Fragment> payloads_;
  std::unordered_map<FragmentId, size_t> rows_by_id_;
  FragmentId next_id_ = 1;

  std::vector<float> prepare(const std::vector<float> &vector) const;
  float to_distance(float faiss_score) const;
};

}  // namespace ragline_core
