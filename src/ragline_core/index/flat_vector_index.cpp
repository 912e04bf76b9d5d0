#include "ragline_core/index/flat_vector_index.hpp"

#include <faiss/utils/distances.h>

#include <algorithm>
#include <cmath>
#include <mutex>
#include <numeric>
#include <stdexcept>

#include "ragline_core/errors.hpp"

namespace ragline_core {

FlatVectorIndex::FlatVectorIndex(size_t dimension, Metric metric)
    : dimension_(dimension), metric_(metric) {
  if (dimension == 0) {
    throw InvalidConfiguration("Vector index dimension must be greater than 0");
  }
}

size_t FlatVectorIndex::size() const {
  std::shared_lock lock(mutex_);
  return payloads_.size();
}

std::vector<FragmentId> FlatVectorIndex::insert(std::vector<VectorIndexEntry> entries) {
  // Validate the whole batch before touching any state.
  for (const auto &entry : entries) {
    if (entry.embedding.size() != dimension_) {
      throw DimensionMismatch(dimension_, entry.embedding.size());
    }
  }

  std::unique_lock lock(mutex_);

  std::unordered_set<FragmentId> batch_ids;
  for (const auto &entry : entries) {
    if (entry.fragment_id == kUnassignedFragmentId) {
      continue;
    }
    if (entry.fragment_id < 0 || ids_.count(entry.fragment_id) > 0 ||
        !batch_ids.insert(entry.fragment_id).second) {
      throw std::invalid_argument("Fragment id " + std::to_string(entry.fragment_id) +
                                  " is invalid or already in the index");
    }
  }

  std::vector<FragmentId> assigned;
  assigned.reserve(entries.size());
  payloads_.reserve(payloads_.size() + entries.size());
  vectors_.reserve(vectors_.size() + entries.size() * dimension_);

  for (auto &entry : entries) {
    FragmentId id = entry.fragment_id;
    if (id == kUnassignedFragmentId) {
      // Skip ids a caller supplied explicitly.
      while (ids_.count(next_id_) > 0 || batch_ids.count(next_id_) > 0) {
        ++next_id_;
      }
      id = next_id_++;
    } else {
      next_id_ = std::max(next_id_, id + 1);
    }
    ids_.insert(id);

    const size_t row_start = vectors_.size();
    vectors_.insert(vectors_.end(), entry.embedding.begin(), entry.embedding.end());
    if (metric_ == Metric::Cosine) {
      // Zero vectors are left as they are and end up orthogonal to everything.
      faiss::fvec_renorm_L2(dimension_, 1, vectors_.data() + row_start);
    }

    Fragment payload = std::move(entry.payload);
    payload.id = id;
    payload.embedding = std::move(entry.embedding);
    payloads_.push_back(std::move(payload));
    assigned.push_back(id);
  }
  return assigned;
}

float FlatVectorIndex::distance_to(const float *query, size_t row) const {
  const float *stored = vectors_.data() + row * dimension_;
  switch (metric_) {
    case Metric::L2:
      return faiss::fvec_L2sqr(query, stored, dimension_);
    case Metric::Dot:
      return -faiss::fvec_inner_product(query, stored, dimension_);
    case Metric::Cosine: {
      // Rows and query are unit length here.
      const float distance = 1.0f - faiss::fvec_inner_product(query, stored, dimension_);
      if (distance < kCosineEpsilon) {
        return 0.0f;
      }
      return std::min(distance, 2.0f);
    }
  }
  return 0.0f;
}

RetrievalResult FlatVectorIndex::query(const std::vector<float> &vector, int k) const {
  if (k <= 0) {
    throw std::invalid_argument("k must be greater than 0, got " + std::to_string(k));
  }
  if (vector.size() != dimension_) {
    throw DimensionMismatch(dimension_, vector.size());
  }

  std::shared_lock lock(mutex_);
  const size_t count = payloads_.size();
  if (count == 0) {
    throw EmptyIndex();
  }

  std::vector<float> normalized;
  const float *query = vector.data();
  if (metric_ == Metric::Cosine) {
    normalized = vector;
    faiss::fvec_renorm_L2(dimension_, 1, normalized.data());
    query = normalized.data();
  }

  std::vector<float> distances(count);
  for (size_t row = 0; row < count; ++row) {
    distances[row] = distance_to(query, row);
  }

  std::vector<size_t> order(count);
  std::iota(order.begin(), order.end(), 0);
  const size_t top = std::min(static_cast<size_t>(k), count);
  // Row number breaks ties, so earlier inserts win.
  std::partial_sort(order.begin(), order.begin() + top, order.end(),
                    [&distances](size_t a, size_t b) {
                      if (distances[a] != distances[b]) {
                        return distances[a] < distances[b];
                      }
                      return a < b;
                    });

  RetrievalResult results;
  results.reserve(top);
  for (size_t i = 0; i < top; ++i) {
    const size_t row = order[i];
    results.push_back({payloads_[row], distances[row]});
  }
  return results;
}

std::vector<Fragment> FlatVectorIndex::entries() const {
  std::shared_lock lock(mutex_);
  return payloads_;
}

}  // namespace ragline_core
