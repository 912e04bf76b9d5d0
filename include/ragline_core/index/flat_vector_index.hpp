#pragma once

#include <shared_mutex>
#include <unordered_set>
#include <vector>

#include "ragline_core/index/vector_index.hpp"

namespace ragline_core {

/**
 * @class FlatVectorIndex
 * @brief Exact brute-force index.
 *
 * Queries compare against every stored vector (O(N*D)) and partially sort the
 * results; ties keep insertion order. This is the intended backend for
 * document-sized corpora. Inserts take an exclusive lock, queries a shared one.
 */
class FlatVectorIndex : public VectorIndex {
 public:
  FlatVectorIndex(size_t dimension, Metric metric);

  // Non-copyable, non-movable because of the mutex
  FlatVectorIndex(const FlatVectorIndex &) = delete;
  FlatVectorIndex &operator=(const FlatVectorIndex &) = delete;

  size_t dimension() const override {
    return dimension_;
  }
  Metric metric() const override {
    return metric_;
  }
  IndexKind kind() const override {
    return IndexKind::Flat;
  }
  size_t size() const override;

  std::vector<FragmentId> insert(std::vector<VectorIndexEntry> entries) override;
  RetrievalResult query(const std::vector<float> &vector, int k) const override;
  std::vector<Fragment> entries() const override;

 private:
  size_t dimension_;
  Metric metric_;

  mutable std::shared_mutex mutex_;
  std::vector<Fragment> payloads_;
  // Row-major copy of every embedding, dimension_ floats per entry.
  // L2-normalised for the cosine metric.
  std::vector<float> vectors_;
  std::unordered_set<FragmentId> ids_;
  FragmentId next_id_ = 1;

  // Cosine distances below this are rounding noise and count as identical direction.
  static constexpr float kCosineEpsilon = 1e-5f;

  float distance_to(const float *query, size_t row) const;
};

}  // namespace ragline_core
