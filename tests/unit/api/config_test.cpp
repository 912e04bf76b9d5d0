#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "../../common/utilities_test.hpp"
#include "ragline_api/config.hpp"

namespace ragline_tests {

using ragline_api::Config;

class ConfigTest : public TempDirTest {};

TEST_F(ConfigTest, AppliesDefaultsWhenMissing) {
  Config cfg = Config::from_json(nlohmann::json::object());

  EXPECT_EQ(cfg.api_base_url, "127.0.0.1:3030");
  EXPECT_EQ(cfg.ollama_url, "http://localhost:11434");
  EXPECT_EQ(cfg.embedding_model, "mxbai-embed-large");
  EXPECT_EQ(cfg.generation_model, "llama3");
  EXPECT_EQ(cfg.chunk_size, 1000);
  EXPECT_EQ(cfg.chunk_overlap, 200);
  EXPECT_EQ(cfg.batch_size, 32);
  EXPECT_EQ(cfg.parallel_batches, 1);
  EXPECT_EQ(cfg.metric, "cosine");
  EXPECT_EQ(cfg.index_type, "flat");
  EXPECT_EQ(cfg.top_k, 4);
  EXPECT_EQ(cfg.max_context_chars, 4000);
  EXPECT_TRUE(cfg.preload_indexes.empty());
}

TEST_F(ConfigTest, LoadsFromJson) {
  nlohmann::json j = {{"api_base_url", "0.0.0.0:8080"},
                      {"generation_model", "mistral"},
                      {"chunk_size", 500},
                      {"chunk_overlap", 50},
                      {"metric", "l2"},
                      {"index_type", "hnsw"},
                      {"preload_indexes", {"./data/people.ragline"}}};

  Config cfg = Config::from_json(j);

  EXPECT_EQ(cfg.api_base_url, "0.0.0.0:8080");
  EXPECT_EQ(cfg.generation_model, "mistral");
  EXPECT_EQ(cfg.chunk_size, 500);
  EXPECT_THAT(cfg.preload_indexes, testing::ElementsAre("./data/people.ragline"));
}

TEST_F(ConfigTest, ConvertsToEngineAndOllamaSettings) {
  nlohmann::json j = {{"chunk_size", 300},   {"chunk_overlap", 30}, {"batch_size", 8},
                      {"parallel_batches", 2}, {"metric", "dot"},   {"index_type", "hnsw"},
                      {"top_k", 6},          {"max_retries", 5},    {"ollama_timeout_s", 30}};
  Config cfg = Config::from_json(j);

  ragline_core::RagEngineOptions options = cfg.to_engine_options();
  EXPECT_EQ(options.ingestion.chunk_size, 300);
  EXPECT_EQ(options.ingestion.chunk_overlap, 30);
  EXPECT_EQ(options.ingestion.batch_size, 8u);
  EXPECT_EQ(options.ingestion.parallel_batches, 2u);
  EXPECT_EQ(options.ingestion.metric, ragline_core::Metric::Dot);
  EXPECT_EQ(options.ingestion.index_kind, ragline_core::IndexKind::Hnsw);
  EXPECT_EQ(options.answering.top_k, 6);
  EXPECT_EQ(options.retry.max_attempts, 5);

  ragline_core::OllamaConfig ollama = cfg.to_ollama_config();
  EXPECT_EQ(ollama.url, "http://localhost:11434");
  EXPECT_EQ(ollama.read_timeout_s, 30);
}

TEST_F(ConfigTest, FromFileParsesAndValidates) {
  auto path = TestUtilities::write_file(temp_dir_ / "raglinerc.json", R"JSON({
    "api_base_url": "127.0.0.1:4000",
    "embedding_model": "nomic-embed-text",
    "batch_size": 16
  })JSON");

  Config cfg = Config::from_file(path.string());

  EXPECT_EQ(cfg.api_base_url, "127.0.0.1:4000");
  EXPECT_EQ(cfg.embedding_model, "nomic-embed-text");
  EXPECT_EQ(cfg.batch_size, 16);
}

TEST_F(ConfigTest, InvalidPathThrows) {
  EXPECT_THROW({ (void)Config::from_file("/nonexistent/path/raglinerc.json"); }, std::runtime_error);
}

TEST_F(ConfigTest, MalformedJsonThrows) {
  auto path = TestUtilities::write_file(temp_dir_ / "bad.json", "{ \"chunk_size\": ");
  EXPECT_THROW({ (void)Config::from_file(path.string()); }, std::runtime_error);
}

TEST_F(ConfigTest, RejectsInvalidValues) {
  const std::vector<nlohmann::json> invalid = {
      {{"api_base_url", ""}},
      {{"api_base_url", "localhost"}},
      {{"ollama_url", ""}},
      {{"generation_model", ""}},
      {{"chunk_size", 100}, {"chunk_overlap", 100}},
      {{"chunk_overlap", -1}},
      {{"batch_size", 0}},
      {{"parallel_batches", 0}},
      {{"top_k", 0}},
      {{"metric", "manhattan"}},
      {{"index_type", "ivf"}},
      {{"chunk_size", "large"}},
  };
  for (const auto &j : invalid) {
    EXPECT_THROW({ (void)Config::from_json(j); }, std::runtime_error) << j.dump();
  }
}

}  // namespace ragline_tests
