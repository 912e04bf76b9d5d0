#pragma once

#include <string>
#include <vector>

namespace ragline_core {

// Failure reported by an external model provider.
class ProviderError : public std::exception {
 public:
  ProviderError(const std::string &message, bool retryable)
      : message_(message), retryable_(retryable) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

  // True for transient failures (connection refused, timeouts).
  bool retryable() const noexcept {
    return retryable_;
  }

 private:
  std::string message_;
  bool retryable_;
};

class EmbeddingProvider {
 public:
  virtual ~EmbeddingProvider() = default;

  virtual std::vector<float> embed(const std::string &text) = 0;
};

struct Prompt {
  std::string instruction;
  std::string context;
  std::string question;
};

class GenerationProvider {
 public:
  virtual ~GenerationProvider() = default;

  virtual std::string generate(const Prompt &prompt) = 0;
};

}  // namespace ragline_core
