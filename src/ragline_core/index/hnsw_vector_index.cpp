#include "ragline_core/index/hnsw_vector_index.hpp"

#include <faiss/utils/distances.h>

#include <algorithm>
#include <mutex>
#include <stdexcept>
#include <unordered_set>

#include "ragline_core/errors.hpp"

namespace ragline_core {

HnswVectorIndex::HnswVectorIndex(size_t dimension, Metric metric)
    : dimension_(dimension), metric_(metric) {
  if (dimension == 0) {
    throw InvalidConfiguration("Vector index dimension must be greater than 0");
  }
  const faiss::MetricType faiss_metric =
      metric == Metric::L2 ? faiss::METRIC_L2 : faiss::METRIC_INNER_PRODUCT;
  base_index_ = std::make_unique<faiss::IndexHNSWFlat>(static_cast<int>(dimension), HNSW_M_PARAM,
                                                       faiss_metric);
  base_index_->hnsw.efConstruction = HNSW_EF_CONSTRUCTION_PARAM;
  base_index_->hnsw.efSearch = HNSW_EF_SEARCH_PARAM;
  // Wrap with IDMap to enable add_with_ids
  id_map_ = std::make_unique<faiss::IndexIDMap>(base_index_.get());
}

HnswVectorIndex::~HnswVectorIndex() = default;

size_t HnswVectorIndex::size() const {
  std::shared_lock lock(mutex_);
  return payloads_.size();
}

std::vector<float> HnswVectorIndex::prepare(const std::vector<float> &vector) const {
  std::vector<float> prepared(vector);
  if (metric_ == Metric::Cosine) {
    faiss::fvec_renorm_L2(dimension_, 1, prepared.data());
  }
  return prepared;
}

float HnswVectorIndex::to_distance(float faiss_score) const {
  switch (metric_) {
    case Metric::L2:
      return faiss_score;
    case Metric::Cosine: {
      const float distance = 1.0f - faiss_score;
      // Same rounding tolerance as the flat index.
      return distance < 1e-5f ? 0.0f : std::min(distance, 2.0f);
    }
    case Metric::Dot:
      return -faiss_score;
  }
  return faiss_score;
}

std::vector<FragmentId> HnswVectorIndex::insert(std::vector<VectorIndexEntry> entries) {
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
    if (entry.fragment_id < 0 || rows_by_id_.count(entry.fragment_id) > 0 ||
        !batch_ids.insert(entry.fragment_id).second) {
      throw std::invalid_argument("Fragment id " + std::to_string(entry.fragment_id) +
                                  " is invalid or already in the index");
    }
  }

  std::vector<FragmentId> assigned;
  std::vector<faiss::idx_t> faiss_ids;
  std::vector<float> flat;
  assigned.reserve(entries.size());
  faiss_ids.reserve(entries.size());
  flat.reserve(entries.size() * dimension_);

  FragmentId next_id = next_id_;
  for (const auto &entry : entries) {
    FragmentId id = entry.fragment_id;
    if (id == kUnassignedFragmentId) {
      while (rows_by_id_.count(next_id) > 0 || batch_ids.count(next_id) > 0) {
        ++next_id;
      }
      id = next_id++;
    } else {
      next_id = std::max(next_id, id + 1);
    }
    assigned.push_back(id);
    faiss_ids.push_back(static_cast<faiss::idx_t>(id));
    std::vector<float> prepared = prepare(entry.embedding);
    flat.insert(flat.end(), prepared.begin(), prepared.end());
  }

  // Faiss first: if it throws, the payload side is still untouched.
  if (!assigned.empty()) {
    id_map_->add_with_ids(static_cast<faiss::idx_t>(assigned.size()), flat.data(),
                          faiss_ids.data());
  }

  next_id_ = next_id;
  for (size_t i = 0; i < entries.size(); ++i) {
    Fragment payload = std::move(entries[i].payload);
    payload.id = assigned[i];
    payload.embedding = std::move(entries[i].embedding);
    rows_by_id_[assigned[i]] = payloads_.size();
    payloads_.push_back(std::move(payload));
  }
  return assigned;
}

RetrievalResult HnswVectorIndex::query(const std::vector<float> &vector, int k) const {
  if (k <= 0) {
    throw std::invalid_argument("k must be greater than 0, got " + std::to_string(k));
  }
  if (vector.size() != dimension_) {
    throw DimensionMismatch(dimension_, vector.size());
  }

  std::shared_lock lock(mutex_);
  if (payloads_.empty()) {
    throw EmptyIndex();
  }

  const int actual_k = std::min(k, static_cast<int>(payloads_.size()));
  std::vector<float> prepared = prepare(vector);
  std::vector<float> scores(actual_k);
  std::vector<faiss::idx_t> labels(actual_k);
  id_map_->search(1, prepared.data(), actual_k, scores.data(), labels.data());

  RetrievalResult results;
  results.reserve(actual_k);
  for (int i = 0; i < actual_k; ++i) {
    if (labels[i] == -1) {
      continue;
    }
    auto it = rows_by_id_.find(static_cast<FragmentId>(labels[i]));
    if (it == rows_by_id_.end()) {
      continue;
    }
    results.push_back({payloads_[it->second], to_distance(scores[i])});
  }
  // Ascending distance for every metric.
  std::stable_sort(results.begin(), results.end(),
                   [](const RetrievedFragment &a, const RetrievedFragment &b) {
                     return a.distance < b.distance;
                   });
  return results;
}

std::vector<Fragment> HnswVectorIndex::entries() const {
  std::shared_lock lock(mutex_);
  return payloads_;
}

}  // namespace ragline_core
