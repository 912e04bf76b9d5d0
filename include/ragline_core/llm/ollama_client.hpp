#pragma once

#include <memory>
#include <string>
#include <vector>

#include "ragline_core/llm/provider.hpp"

class Ollama;

namespace ragline_core {

class OllamaError : public ProviderError {
 public:
  OllamaError(const std::string &message, bool retryable) : ProviderError(message, retryable) {}
};

struct OllamaConfig {
  std::string url = "http://localhost:11434";
  std::string embedding_model = "mxbai-embed-large";
  std::string generation_model = "llama3";
  int read_timeout_s = 120;
  int write_timeout_s = 120;
};

class OllamaClient : public EmbeddingProvider, public GenerationProvider {
 public:
  explicit OllamaClient(const OllamaConfig &config);
  ~OllamaClient() override;

  // Disable copy constructor and assignment
  OllamaClient(const OllamaClient &) = delete;
  OllamaClient &operator=(const OllamaClient &) = delete;

  std::vector<float> embed(const std::string &text) override;

  // Renders the prompt and runs a non-streaming completion.
  std::string generate(const Prompt &prompt) override;

  virtual bool is_server_available();

  static std::string render_prompt(const Prompt &prompt);

  const OllamaConfig &config() const {
    return config_;
  }

 private:
  OllamaConfig config_;
  // Per-client connection; two clients never share server settings.
  std::unique_ptr<Ollama> server_;

  void setup_server_connection();
};

}  // namespace ragline_core
