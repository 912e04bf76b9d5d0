#include "ragline_core/index/vector_index.hpp"

#include <algorithm>
#include <cctype>

#include "ragline_core/errors.hpp"
#include "ragline_core/index/flat_vector_index.hpp"
#include "ragline_core/index/hnsw_vector_index.hpp"

namespace ragline_core {

namespace {

std::string lowercase(std::string str) {
  std::transform(str.begin(), str.end(), str.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return str;
}

}  // namespace

std::string to_string(Metric metric) {
  switch (metric) {
    case Metric::L2:
      return "l2";
    case Metric::Cosine:
      return "cosine";
    case Metric::Dot:
      return "dot";
    default:
      return "unknown";
  }
}

Metric metric_from_string(const std::string &str) {
  const std::string name = lowercase(str);
  if (name == "l2")
    return Metric::L2;
  if (name == "cosine")
    return Metric::Cosine;
  if (name == "dot")
    return Metric::Dot;
  throw InvalidConfiguration("Unknown metric: " + str);
}

std::string to_string(IndexKind kind) {
  switch (kind) {
    case IndexKind::Flat:
      return "flat";
    case IndexKind::Hnsw:
      return "hnsw";
    default:
      return "unknown";
  }
}

IndexKind index_kind_from_string(const std::string &str) {
  const std::string name = lowercase(str);
  if (name == "flat")
    return IndexKind::Flat;
  if (name == "hnsw")
    return IndexKind::Hnsw;
  throw InvalidConfiguration("Unknown index kind: " + str);
}

std::shared_ptr<VectorIndex> make_vector_index(IndexKind kind, size_t dimension, Metric metric) {
  switch (kind) {
    case IndexKind::Hnsw:
      return std::make_shared<HnswVectorIndex>(dimension, metric);
    case IndexKind::Flat:
    default:
      return std::make_shared<FlatVectorIndex>(dimension, metric);
  }
}

}  // namespace ragline_core
