#include "ragline_core/llm/ollama_client.hpp"

#include <iostream>

#include "ollama.hpp"

namespace ragline_core {

OllamaClient::OllamaClient(const OllamaConfig &config)
    : config_(config), server_(std::make_unique<Ollama>(config.url)) {
  setup_server_connection();
}

OllamaClient::~OllamaClient() = default;

void OllamaClient::setup_server_connection() {
  server_->setReadTimeout(config_.read_timeout_s);
  server_->setWriteTimeout(config_.write_timeout_s);
  // An unreachable server is not fatal here; every call reports it as retryable.
  if (!server_->is_running()) {
    std::cerr << "[OllamaClient] Warning: Ollama server is not running at " << config_.url
              << std::endl;
  }
}

std::vector<float> OllamaClient::embed(const std::string &text) {
  nlohmann::json json_response;
  try {
    ollama::response response = server_->generate_embeddings(config_.embedding_model, text);
    json_response = response.as_json();
  } catch (const ollama::exception &e) {
    throw OllamaError("Embedding generation failed: " + std::string(e.what()), true);
  } catch (const nlohmann::json::exception &e) {
    throw OllamaError("Malformed embedding response: " + std::string(e.what()), false);
  }

  if (!json_response.contains("embeddings")) {
    throw OllamaError("Response does not contain embeddings field", false);
  }

  // Handle different embedding response formats
  const auto &embeddings = json_response["embeddings"];
  if (!embeddings.is_array()) {
    throw OllamaError("Embeddings field is not an array", false);
  }
  try {
    if (!embeddings.empty() && embeddings[0].is_array()) {
      // Array of arrays - take the first embedding vector
      return embeddings[0].get<std::vector<float>>();
    }
    return embeddings.get<std::vector<float>>();
  } catch (const nlohmann::json::exception &e) {
    throw OllamaError("Malformed embedding values: " + std::string(e.what()), false);
  }
}

std::string OllamaClient::render_prompt(const Prompt &prompt) {
  std::string rendered = prompt.instruction;
  rendered += "\n\nContext:\n";
  rendered += prompt.context;
  rendered += "\n\nQuestion: ";
  rendered += prompt.question;
  rendered += "\nAnswer:";
  return rendered;
}

std::string OllamaClient::generate(const Prompt &prompt) {
  try {
    ollama::response response = server_->generate(config_.generation_model, render_prompt(prompt));
    return response.as_simple_string();
  } catch (const ollama::exception &e) {
    throw OllamaError("Generation failed: " + std::string(e.what()), true);
  } catch (const nlohmann::json::exception &e) {
    throw OllamaError("Malformed generation response: " + std::string(e.what()), false);
  }
}

bool OllamaClient::is_server_available() {
  return server_->is_running();
}

}  // namespace ragline_core
