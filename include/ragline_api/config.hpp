#pragma once

#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "ragline_core/errors.hpp"
#include "ragline_core/llm/ollama_client.hpp"
#include "ragline_core/rag_engine.hpp"

namespace ragline_api {

class Config {
 public:
  std::string api_base_url;
  std::string ollama_url;
  std::string embedding_model;
  std::string generation_model;
  int ollama_timeout_s;

  // Ingestion
  int chunk_size;
  int chunk_overlap;
  int batch_size;
  int parallel_batches;
  std::string metric;
  std::string index_type;
  int max_retries;

  // Answering
  int top_k;
  int max_context_chars;

  // Indexes listed here are loaded at startup.
  std::vector<std::string> preload_indexes;

  // Load configuration from a JSON file at the given path
  static Config from_file(const std::string &filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw std::runtime_error("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const nlohmann::json::exception &e) {
      throw std::runtime_error(std::string("Failed to parse JSON in config file '") + filename +
                               "': " + e.what());
    }

    return from_json(json_config);
  }

  static Config from_json(const nlohmann::json &json_config) {
    Config config;
    try {
      config.api_base_url = json_config.value("api_base_url", std::string("127.0.0.1:3030"));
      config.ollama_url = json_config.value("ollama_url", std::string("http://localhost:11434"));
      config.embedding_model = json_config.value("embedding_model", std::string("mxbai-embed-large"));
      config.generation_model = json_config.value("generation_model", std::string("llama3"));
      config.ollama_timeout_s = json_config.value("ollama_timeout_s", 120);

      config.chunk_size = json_config.value("chunk_size", 1000);
      config.chunk_overlap = json_config.value("chunk_overlap", 200);
      config.batch_size = json_config.value("batch_size", 32);
      config.parallel_batches = json_config.value("parallel_batches", 1);
      config.metric = json_config.value("metric", std::string("cosine"));
      config.index_type = json_config.value("index_type", std::string("flat"));
      config.max_retries = json_config.value("max_retries", 3);

      config.top_k = json_config.value("top_k", 4);
      config.max_context_chars = json_config.value("max_context_chars", 4000);
      config.preload_indexes =
          json_config.value("preload_indexes", std::vector<std::string>{});
    } catch (const nlohmann::json::type_error &e) {
      throw std::runtime_error(std::string("Invalid value type in config: ") + e.what());
    }

    config.validate();
    return config;
  }

  ragline_core::OllamaConfig to_ollama_config() const {
    ragline_core::OllamaConfig ollama;
    ollama.url = ollama_url;
    ollama.embedding_model = embedding_model;
    ollama.generation_model = generation_model;
    ollama.read_timeout_s = ollama_timeout_s;
    ollama.write_timeout_s = ollama_timeout_s;
    return ollama;
  }

  ragline_core::RagEngineOptions to_engine_options() const {
    ragline_core::RagEngineOptions options;
    options.ingestion.chunk_size = chunk_size;
    options.ingestion.chunk_overlap = chunk_overlap;
    options.ingestion.batch_size = static_cast<size_t>(batch_size);
    options.ingestion.parallel_batches = static_cast<size_t>(parallel_batches);
    options.ingestion.metric = ragline_core::metric_from_string(metric);
    options.ingestion.index_kind = ragline_core::index_kind_from_string(index_type);
    options.answering.top_k = top_k;
    options.answering.max_context_chars = static_cast<size_t>(max_context_chars);
    options.retry.max_attempts = max_retries;
    return options;
  }

 private:
  void validate() const {
    if (api_base_url.empty()) {
      throw std::runtime_error("api_base_url cannot be empty");
    }
    if (api_base_url.find(':') == std::string::npos) {
      throw std::runtime_error("api_base_url must have the form host:port");
    }
    if (ollama_url.empty()) {
      throw std::runtime_error("ollama_url cannot be empty");
    }
    if (embedding_model.empty()) {
      throw std::runtime_error("embedding_model cannot be empty");
    }
    if (generation_model.empty()) {
      throw std::runtime_error("generation_model cannot be empty");
    }
    if (ollama_timeout_s <= 0) {
      throw std::runtime_error("ollama_timeout_s must be greater than 0");
    }
    if (chunk_size <= 0) {
      throw std::runtime_error("chunk_size must be greater than 0");
    }
    if (chunk_overlap < 0 || chunk_overlap >= chunk_size) {
      throw std::runtime_error("chunk_overlap must be in [0, chunk_size)");
    }
    if (batch_size <= 0) {
      throw std::runtime_error("batch_size must be greater than 0");
    }
    if (parallel_batches <= 0) {
      throw std::runtime_error("parallel_batches must be greater than 0");
    }
    if (max_retries <= 0) {
      throw std::runtime_error("max_retries must be greater than 0");
    }
    if (top_k <= 0) {
      throw std::runtime_error("top_k must be greater than 0");
    }
    if (max_context_chars <= 0) {
      throw std::runtime_error("max_context_chars must be greater than 0");
    }
    try {
      ragline_core::metric_from_string(metric);
      ragline_core::index_kind_from_string(index_type);
    } catch (const ragline_core::InvalidConfiguration &e) {
      throw std::runtime_error(e.what());
    }
  }
};

}  // namespace ragline_api
