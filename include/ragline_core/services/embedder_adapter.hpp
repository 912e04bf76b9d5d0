#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "ragline_core/llm/provider.hpp"

namespace ragline_core {

struct RetryPolicy {
  int max_attempts = 3;
  std::chrono::milliseconds initial_backoff{200};
  double backoff_multiplier = 2.0;
  std::chrono::milliseconds max_backoff{5000};
};

/**
 * @class EmbedderAdapter
 * @brief Uniform, validated front for an EmbeddingProvider.
 *
 * - Provider failures become EmbeddingUnavailable; retryable ones are retried
 *   with exponential backoff first.
 * - The output dimension is probed once and every later vector is checked
 *   against it.
 * - A batch either returns a vector for every input, in order, or throws.
 *
 * Thread-safe as long as the provider is.
 */
class EmbedderAdapter {
 public:
  static constexpr const char *DIMENSION_PROBE_TEXT = "dimension probe";

  explicit EmbedderAdapter(std::shared_ptr<EmbeddingProvider> provider, RetryPolicy policy = {});
  virtual ~EmbedderAdapter() = default;

  EmbedderAdapter(const EmbedderAdapter &) = delete;
  EmbedderAdapter &operator=(const EmbedderAdapter &) = delete;

  virtual std::vector<std::vector<float>> embed_batch(const std::vector<std::string> &texts);
  virtual std::vector<float> embed_one(const std::string &text);

  // Output dimension of the provider. Probes it on first use.
  virtual size_t dimension();

  const RetryPolicy &retry_policy() const {
    return policy_;
  }

 private:
  std::shared_ptr<EmbeddingProvider> provider_;
  RetryPolicy policy_;

  std::mutex dimension_mutex_;
  std::optional<size_t> dimension_;

  std::vector<float> embed_with_retry(const std::string &text);
  void check_dimension(const std::vector<float> &vector, size_t expected) const;
};

}  // namespace ragline_core
