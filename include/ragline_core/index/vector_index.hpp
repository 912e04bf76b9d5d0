#pragma once

#include <memory>
#include <string>
#include <vector>

#include "ragline_core/types/fragment.hpp"

namespace ragline_core {

enum class Metric { L2, Cosine, Dot };

std::string to_string(Metric metric);
// @throw InvalidConfiguration for unknown names ("l2", "cosine", "dot").
Metric metric_from_string(const std::string &str);

enum class IndexKind { Flat, Hnsw };

std::string to_string(IndexKind kind);
IndexKind index_kind_from_string(const std::string &str);

struct VectorIndexEntry {
  // kUnassignedFragmentId lets the index pick the id.
  FragmentId fragment_id = kUnassignedFragmentId;
  std::vector<float> embedding;
  Fragment payload;
};

/**
 * @class VectorIndex
 * @brief Append-only store of fragment embeddings with k-nearest-neighbour lookup.
 *
 * Every vector in one index has the dimension fixed at construction. Distances
 * follow a "smaller is closer" convention for every metric:
 *   L2      squared euclidean distance
 *   Cosine  1 - cosine similarity
 *   Dot     negated inner product
 *
 * Implementations are safe to use from several threads: an insert becomes
 * visible as a whole or not at all.
 */
class VectorIndex {
 public:
  virtual ~VectorIndex() = default;

  virtual size_t dimension() const = 0;
  virtual Metric metric() const = 0;
  virtual size_t size() const = 0;
  virtual IndexKind kind() const = 0;

  /**
   * @brief Appends entries and returns their ids in input order.
   * @throw DimensionMismatch if any embedding length differs from dimension();
   *        nothing is inserted in that case.
   * @throw std::invalid_argument if a supplied id is already taken.
   */
  virtual std::vector<FragmentId> insert(std::vector<VectorIndexEntry> entries) = 0;

  /**
   * @brief Returns up to k entries ordered by ascending distance.
   * @throw DimensionMismatch if vector.size() != dimension().
   * @throw EmptyIndex if nothing has been inserted.
   * @throw std::invalid_argument if k <= 0.
   */
  virtual RetrievalResult query(const std::vector<float> &vector, int k) const = 0;

  // Snapshot of all stored fragments (with embeddings) in insertion order.
  virtual std::vector<Fragment> entries() const = 0;
};

/**
 * @brief Creates an empty index of the requested backend.
 * @throw InvalidConfiguration if dimension is 0.
 */
std::shared_ptr<VectorIndex> make_vector_index(IndexKind kind, size_t dimension, Metric metric);

}  // namespace ragline_core
