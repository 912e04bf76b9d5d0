#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>

#include "../../common/mocks_test.hpp"
#include "../../common/utilities_test.hpp"
#include "ragline_core/errors.hpp"
#include "ragline_core/index/flat_vector_index.hpp"
#include "ragline_core/services/answering_pipeline.hpp"

namespace ragline_tests {

using ragline_core::AnsweringOptions;
using ragline_core::AnsweringPipeline;
using ragline_core::Prompt;
using ::testing::_;
using ::testing::Return;
using ::testing::SaveArg;

class AnsweringPipelineTest : public ::testing::Test {
 protected:
  void SetUp() override {
    provider_ = std::make_shared<KeywordEmbeddingProvider>(
        std::vector<std::string>{"alice", "bob", "carol"});
    embedder_ = std::make_shared<ragline_core::EmbedderAdapter>(provider_, fast_retry_policy());
    index_ = std::make_shared<ragline_core::FlatVectorIndex>(provider_->dimension(),
                                                             ragline_core::Metric::Cosine);
    generator_ = std::make_shared<testing::NiceMock<MockGenerationProvider>>();
  }

  void populate() {
    std::vector<ragline_core::VectorIndexEntry> entries;
    for (const std::string text : {"Alice is an engineer at Acme.", "Bob is a designer at Acme.",
                                   "Carol is a manager at Acme."}) {
      entries.push_back(TestUtilities::make_entry(provider_->embed(text), text));
    }
    index_->insert(std::move(entries));
  }

  AnsweringPipeline make_pipeline(AnsweringOptions options = {}) {
    auto retriever = std::make_shared<ragline_core::Retriever>(index_, embedder_);
    return AnsweringPipeline(retriever, generator_, options);
  }

  static ragline_core::RetrievalResult hits(const std::vector<std::string> &texts) {
    ragline_core::RetrievalResult result;
    for (const auto &text : texts) {
      ragline_core::RetrievedFragment hit;
      hit.fragment.text = text;
      hit.distance = 0.0f;
      result.push_back(hit);
    }
    return result;
  }

  std::shared_ptr<KeywordEmbeddingProvider> provider_;
  std::shared_ptr<ragline_core::EmbedderAdapter> embedder_;
  std::shared_ptr<ragline_core::FlatVectorIndex> index_;
  std::shared_ptr<testing::NiceMock<MockGenerationProvider>> generator_;
};

TEST_F(AnsweringPipelineTest, ContextNumbersFragmentsInRankOrder) {
  std::string context = AnsweringPipeline::assemble_context(hits({"first", "second"}), 1000);
  EXPECT_EQ(context, "[1] first\n\n[2] second");
}

TEST_F(AnsweringPipelineTest, ContextIsCutAtTheCharacterBudget) {
  size_t used = 0;
  std::string context =
      AnsweringPipeline::assemble_context(hits({"abcdef", "ghijkl", "mnopqr"}), 15, &used);

  // "[1] abcdef" is 10 code points, leaving 5 for "\n\n[2] ghijkl".
  EXPECT_EQ(context, "[1] abcdef\n\n[2]");
  EXPECT_EQ(used, 2u);
}

TEST_F(AnsweringPipelineTest, ContextCutNeverSplitsACodePoint) {
  std::string context =
      AnsweringPipeline::assemble_context(hits({"\xc3\xa9\xc3\xa9\xc3\xa9"}), 5);
  EXPECT_EQ(context, "[1] \xc3\xa9");
}

TEST_F(AnsweringPipelineTest, InvalidUtf8InFragmentTextIsReplaced) {
  size_t used = 0;
  std::string context = AnsweringPipeline::assemble_context(hits({"ab\xff", "cd"}), 100, &used);

  EXPECT_EQ(context, "[1] ab\xef\xbf\xbd\n\n[2] cd");
  EXPECT_EQ(used, 2u);
}

TEST_F(AnsweringPipelineTest, EmptyFragmentsGiveEmptyContext) {
  size_t used = 7;
  EXPECT_EQ(AnsweringPipeline::assemble_context({}, 100, &used), "");
  EXPECT_EQ(used, 0u);
}

TEST_F(AnsweringPipelineTest, PromptCarriesInstructionContextAndQuestion) {
  populate();
  Prompt captured;
  EXPECT_CALL(*generator_, generate(_))
      .WillOnce(testing::DoAll(SaveArg<0>(&captured), Return(std::string("Bob is a designer [1]."))));
  AnsweringOptions options;
  options.top_k = 1;

  ragline_core::AnswerResult result = make_pipeline(options).answer_with_sources("What does Bob do?");

  EXPECT_EQ(result.answer, "Bob is a designer [1].");
  EXPECT_EQ(captured.question, "What does Bob do?");
  EXPECT_EQ(captured.instruction, AnsweringOptions::DEFAULT_INSTRUCTION);
  EXPECT_EQ(captured.context, "[1] Bob is a designer at Acme.");
  ASSERT_EQ(result.sources.size(), 1u);
  EXPECT_EQ(result.sources[0].fragment.text, "Bob is a designer at Acme.");
}

TEST_F(AnsweringPipelineTest, EmptyIndexStillAsksTheGenerator) {
  Prompt captured;
  EXPECT_CALL(*generator_, generate(_))
      .WillOnce(testing::DoAll(SaveArg<0>(&captured), Return(std::string("Not enough information."))));

  ragline_core::AnswerResult result = make_pipeline().answer_with_sources("Who is Dave?");

  EXPECT_EQ(result.answer, "Not enough information.");
  EXPECT_TRUE(captured.context.empty());
  EXPECT_TRUE(result.sources.empty());
}

TEST_F(AnsweringPipelineTest, SourcesOnlyListFragmentsThatFitTheBudget) {
  populate();
  AnsweringOptions options;
  options.top_k = 3;
  options.max_context_chars = 10;

  ragline_core::AnswerResult result = make_pipeline(options).answer_with_sources("Alice");

  ASSERT_EQ(result.sources.size(), 1u);
  EXPECT_EQ(result.sources[0].fragment.text, "Alice is an engineer at Acme.");
}

TEST_F(AnsweringPipelineTest, ProviderFailureBecomesGenerationUnavailable) {
  populate();
  EXPECT_CALL(*generator_, generate(_))
      .WillOnce(testing::Throw(ragline_core::ProviderError("connection refused", true)));

  try {
    make_pipeline().answer("What does Alice do?");
    FAIL() << "Expected GenerationUnavailable";
  } catch (const ragline_core::GenerationUnavailable &e) {
    EXPECT_TRUE(e.retryable());
    EXPECT_EQ(e.kind(), ragline_core::ErrorKind::GenerationUnavailable);
  }
}

TEST_F(AnsweringPipelineTest, UnclassifiedGeneratorExceptionBecomesGenerationUnavailable) {
  populate();
  EXPECT_CALL(*generator_, generate(_))
      .WillOnce(testing::Throw(std::runtime_error("[json.exception.type_error.302] bad reply")));

  try {
    make_pipeline().answer("What does Alice do?");
    FAIL() << "Expected GenerationUnavailable";
  } catch (const ragline_core::GenerationUnavailable &e) {
    EXPECT_FALSE(e.retryable());
    EXPECT_THAT(e.what(), testing::HasSubstr("bad reply"));
  }
}

TEST_F(AnsweringPipelineTest, FilterNarrowsSources) {
  std::vector<ragline_core::VectorIndexEntry> entries;
  entries.push_back(TestUtilities::make_entry(provider_->embed("Alice"), "Alice page 1", {{"page", "1"}}));
  entries.push_back(TestUtilities::make_entry(provider_->embed("Alice"), "Alice page 2", {{"page", "2"}}));
  index_->insert(std::move(entries));
  ragline_core::MetadataFilter filter;
  filter.where_between("page", 2, 2);

  ragline_core::AnswerResult result = make_pipeline().answer_with_sources("Alice", filter);

  ASSERT_EQ(result.sources.size(), 1u);
  EXPECT_EQ(result.sources[0].fragment.text, "Alice page 2");
}

TEST_F(AnsweringPipelineTest, RejectsNonPositiveTopK) {
  AnsweringOptions options;
  options.top_k = 0;
  EXPECT_THROW(make_pipeline(options), ragline_core::InvalidConfiguration);
}

}  // namespace ragline_tests
