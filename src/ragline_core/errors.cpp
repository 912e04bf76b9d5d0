#include "ragline_core/errors.hpp"

namespace ragline_core {

std::string to_string(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::InvalidConfiguration:
      return "InvalidConfiguration";
    case ErrorKind::DocumentUnreadable:
      return "DocumentUnreadable";
    case ErrorKind::EmbeddingUnavailable:
      return "EmbeddingUnavailable";
    case ErrorKind::DimensionMismatch:
      return "DimensionMismatch";
    case ErrorKind::EmptyIndex:
      return "EmptyIndex";
    case ErrorKind::GenerationUnavailable:
      return "GenerationUnavailable";
    case ErrorKind::IncompatibleIndex:
      return "IncompatibleIndex";
    case ErrorKind::Cancelled:
      return "Cancelled";
    case ErrorKind::IndexFailure:
      return "IndexFailure";
    default:
      return "Unknown";
  }
}

std::string to_string(IngestionStage stage) {
  switch (stage) {
    case IngestionStage::Parsing:
      return "parsing";
    case IngestionStage::Fragmenting:
      return "fragmenting";
    case IngestionStage::Embedding:
      return "embedding";
    case IngestionStage::Indexing:
      return "indexing";
    default:
      return "unknown";
  }
}

IngestionError::IngestionError(IngestionStage stage,
                               ErrorKind cause_kind,
                               const std::string &cause,
                               size_t completed,
                               size_t requested,
                               std::shared_ptr<VectorIndex> partial_index)
    : stage_(stage),
      cause_kind_(cause_kind),
      completed_(completed),
      requested_(requested),
      partial_index_(std::move(partial_index)) {
  message_ = "Ingestion failed during " + to_string(stage) + " (" + to_string(cause_kind) +
             "): " + cause + " [completed=" + std::to_string(completed) +
             ", requested=" + std::to_string(requested) + "]";
}

}  // namespace ragline_core
