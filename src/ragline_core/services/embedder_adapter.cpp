#include "ragline_core/services/embedder_adapter.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <thread>

#include "ragline_core/errors.hpp"

namespace ragline_core {

EmbedderAdapter::EmbedderAdapter(std::shared_ptr<EmbeddingProvider> provider, RetryPolicy policy)
    : provider_(std::move(provider)), policy_(policy) {
  if (!provider_) {
    throw InvalidConfiguration("EmbedderAdapter requires an embedding provider");
  }
  if (policy_.max_attempts < 1) {
    throw InvalidConfiguration("RetryPolicy.max_attempts must be at least 1");
  }
}

std::vector<float> EmbedderAdapter::embed_with_retry(const std::string &text) {
  auto backoff = policy_.initial_backoff;
  for (int attempt = 1;; ++attempt) {
    std::vector<float> vector;
    try {
      vector = provider_->embed(text);
    } catch (const ProviderError &e) {
      if (!e.retryable()) {
        throw EmbeddingUnavailable(e.what(), false);
      }
      if (attempt >= policy_.max_attempts) {
        throw EmbeddingUnavailable("Giving up after " + std::to_string(attempt) +
                                       " attempts: " + e.what(),
                                   true);
      }
      std::cerr << "[EmbedderAdapter] Attempt " << attempt << " failed (" << e.what()
                << "), retrying in " << backoff.count() << "ms" << std::endl;
      std::this_thread::sleep_for(backoff);
      auto next = std::chrono::milliseconds(
          static_cast<long long>(backoff.count() * policy_.backoff_multiplier));
      backoff = std::min(next, policy_.max_backoff);
      continue;
    } catch (const std::exception &e) {
      // Unclassified provider failure, e.g. a malformed response body.
      throw EmbeddingUnavailable(std::string("Embedding provider failed: ") + e.what(), false);
    }

    if (vector.empty()) {
      throw EmbeddingUnavailable("Provider returned an empty embedding", false);
    }
    return vector;
  }
}

void EmbedderAdapter::check_dimension(const std::vector<float> &vector, size_t expected) const {
  if (vector.size() != expected) {
    throw EmbeddingUnavailable("Provider returned a " + std::to_string(vector.size()) +
                                   "-dimensional vector, expected " + std::to_string(expected),
                               false);
  }
  if (!std::all_of(vector.begin(), vector.end(), [](float v) { return std::isfinite(v); })) {
    throw EmbeddingUnavailable("Provider returned an embedding with non-finite components", false);
  }
}

size_t EmbedderAdapter::dimension() {
  std::lock_guard<std::mutex> lock(dimension_mutex_);
  if (!dimension_) {
    std::vector<float> probe = embed_with_retry(DIMENSION_PROBE_TEXT);
    check_dimension(probe, probe.size());
    dimension_ = probe.size();
    std::cout << "Embedding dimension probed: " << *dimension_ << std::endl;
  }
  return *dimension_;
}

std::vector<float> EmbedderAdapter::embed_one(const std::string &text) {
  const size_t expected = dimension();
  std::vector<float> vector = embed_with_retry(text);
  check_dimension(vector, expected);
  return vector;
}

std::vector<std::vector<float>> EmbedderAdapter::embed_batch(const std::vector<std::string> &texts) {
  if (texts.empty()) {
    return {};
  }
  const size_t expected = dimension();
  std::vector<std::vector<float>> vectors;
  vectors.reserve(texts.size());
  for (const auto &text : texts) {
    std::vector<float> vector = embed_with_retry(text);
    check_dimension(vector, expected);
    vectors.push_back(std::move(vector));
  }
  return vectors;
}

}  // namespace ragline_core
