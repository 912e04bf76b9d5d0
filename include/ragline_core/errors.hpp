#pragma once

#include <cstddef>
#include <memory>
#include <string>

namespace ragline_core {

enum class ErrorKind {
  InvalidConfiguration,
  DocumentUnreadable,
  EmbeddingUnavailable,
  DimensionMismatch,
  EmptyIndex,
  GenerationUnavailable,
  IncompatibleIndex,
  Cancelled,
  // Unexpected failure inside an index backend, e.g. a faiss exception.
  IndexFailure
};

std::string to_string(ErrorKind kind);

class RaglineError : public std::exception {
 public:
  RaglineError(ErrorKind kind, const std::string &message) : kind_(kind), message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

  ErrorKind kind() const noexcept {
    return kind_;
  }

 private:
  ErrorKind kind_;
  std::string message_;
};

// Bad chunking or pipeline parameters.
class InvalidConfiguration : public RaglineError {
 public:
  explicit InvalidConfiguration(const std::string &message)
      : RaglineError(ErrorKind::InvalidConfiguration, message) {}
};

// Parsing failure. Never retryable.
class DocumentUnreadable : public RaglineError {
 public:
  explicit DocumentUnreadable(const std::string &message)
      : RaglineError(ErrorKind::DocumentUnreadable, message) {}
};

class EmbeddingUnavailable : public RaglineError {
 public:
  EmbeddingUnavailable(const std::string &message, bool retryable)
      : RaglineError(ErrorKind::EmbeddingUnavailable, message), retryable_(retryable) {}

  bool retryable() const noexcept {
    return retryable_;
  }

 private:
  bool retryable_;
};

class DimensionMismatch : public RaglineError {
 public:
  DimensionMismatch(size_t expected, size_t actual)
      : RaglineError(ErrorKind::DimensionMismatch,
                     "Vector dimension mismatch. Expected " + std::to_string(expected) + ", got " +
                         std::to_string(actual)),
        expected_(expected),
        actual_(actual) {}

  size_t expected() const noexcept {
    return expected_;
  }
  size_t actual() const noexcept {
    return actual_;
  }

 private:
  size_t expected_;
  size_t actual_;
};

class EmptyIndex : public RaglineError {
 public:
  EmptyIndex() : RaglineError(ErrorKind::EmptyIndex, "Query against an empty index") {}
};

class GenerationUnavailable : public RaglineError {
 public:
  GenerationUnavailable(const std::string &message, bool retryable)
      : RaglineError(ErrorKind::GenerationUnavailable, message), retryable_(retryable) {}

  bool retryable() const noexcept {
    return retryable_;
  }

 private:
  bool retryable_;
};

class IncompatibleIndex : public RaglineError {
 public:
  explicit IncompatibleIndex(const std::string &message)
      : RaglineError(ErrorKind::IncompatibleIndex, message) {}
};

class OperationCancelled : public RaglineError {
 public:
  explicit OperationCancelled(const std::string &message)
      : RaglineError(ErrorKind::Cancelled, message) {}
};

enum class IngestionStage { Parsing, Fragmenting, Embedding, Indexing };

std::string to_string(IngestionStage stage);

class VectorIndex;

/**
 * @brief Failure during ingestion, carrying how much work was committed.
 *
 * Batches committed before the failure stay in the index; partial_index()
 * exposes it so callers can decide whether to proceed with partial results.
 */
class IngestionError : public std::exception {
 public:
  IngestionError(IngestionStage stage,
                 ErrorKind cause_kind,
                 const std::string &cause,
                 size_t completed,
                 size_t requested,
                 std::shared_ptr<VectorIndex> partial_index = nullptr);

  const char *what() const noexcept override {
    return message_.c_str();
  }

  IngestionStage stage() const noexcept {
    return stage_;
  }
  ErrorKind cause_kind() const noexcept {
    return cause_kind_;
  }
  size_t completed() const noexcept {
    return completed_;
  }
  size_t requested() const noexcept {
    return requested_;
  }
  const std::shared_ptr<VectorIndex> &partial_index() const noexcept {
    return partial_index_;
  }

 private:
  IngestionStage stage_;
  ErrorKind cause_kind_;
  size_t completed_;
  size_t requested_;
  std::shared_ptr<VectorIndex> partial_index_;
  std::string message_;
};

}  // namespace ragline_core
