#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <limits>
#include <memory>
#include <stdexcept>

#include "../../common/mocks_test.hpp"
#include "ragline_core/errors.hpp"
#include "ragline_core/services/embedder_adapter.hpp"

namespace ragline_tests {

using ragline_core::EmbedderAdapter;
using ragline_core::ProviderError;
using ::testing::_;
using ::testing::Return;
using ::testing::Throw;

class EmbedderAdapterTest : public ::testing::Test {
 protected:
  void SetUp() override {
    provider_ = std::make_shared<testing::NiceMock<MockEmbeddingProvider>>();
    // Calls without a more specific expectation fall back to the default vector.
    EXPECT_CALL(*provider_, embed(_)).Times(testing::AnyNumber());
  }

  std::shared_ptr<testing::NiceMock<MockEmbeddingProvider>> provider_;
};

TEST_F(EmbedderAdapterTest, RequiresProvider) {
  EXPECT_THROW(EmbedderAdapter(nullptr), ragline_core::InvalidConfiguration);
}

TEST_F(EmbedderAdapterTest, ProbesDimensionOnce) {
  EXPECT_CALL(*provider_, embed(EmbedderAdapter::DIMENSION_PROBE_TEXT))
      .Times(1)
      .WillOnce(Return(std::vector<float>{1.0f, 2.0f, 3.0f}));
  EmbedderAdapter adapter(provider_, fast_retry_policy());

  EXPECT_EQ(adapter.dimension(), 3u);
  EXPECT_EQ(adapter.dimension(), 3u);
}

TEST_F(EmbedderAdapterTest, BatchReturnsVectorsInInputOrder) {
  ON_CALL(*provider_, embed(_)).WillByDefault(Return(std::vector<float>{0.0f, 0.0f}));
  EXPECT_CALL(*provider_, embed("first")).WillOnce(Return(std::vector<float>{1.0f, 0.0f}));
  EXPECT_CALL(*provider_, embed("second")).WillOnce(Return(std::vector<float>{0.0f, 1.0f}));
  EmbedderAdapter adapter(provider_, fast_retry_policy());

  auto vectors = adapter.embed_batch({"first", "second"});

  ASSERT_EQ(vectors.size(), 2u);
  EXPECT_EQ(vectors[0], (std::vector<float>{1.0f, 0.0f}));
  EXPECT_EQ(vectors[1], (std::vector<float>{0.0f, 1.0f}));
}

TEST_F(EmbedderAdapterTest, EmptyBatchDoesNotCallProvider) {
  EXPECT_CALL(*provider_, embed(_)).Times(0);
  EmbedderAdapter adapter(provider_, fast_retry_policy());
  EXPECT_TRUE(adapter.embed_batch({}).empty());
}

TEST_F(EmbedderAdapterTest, RetriesTransientFailures) {
  EXPECT_CALL(*provider_, embed("flaky"))
      .WillOnce(Throw(ProviderError("connection refused", true)))
      .WillOnce(Throw(ProviderError("connection refused", true)))
      .WillOnce(Return(std::vector<float>(8, 0.25f)));
  EmbedderAdapter adapter(provider_, fast_retry_policy(3));

  EXPECT_EQ(adapter.embed_one("flaky"), std::vector<float>(8, 0.25f));
}

TEST_F(EmbedderAdapterTest, GivesUpAfterMaxAttemptsAsRetryable) {
  EXPECT_CALL(*provider_, embed("down"))
      .Times(2)
      .WillRepeatedly(Throw(ProviderError("timeout", true)));
  EmbedderAdapter adapter(provider_, fast_retry_policy(2));

  try {
    adapter.embed_one("down");
    FAIL() << "Expected EmbeddingUnavailable";
  } catch (const ragline_core::EmbeddingUnavailable &e) {
    EXPECT_TRUE(e.retryable());
    EXPECT_EQ(e.kind(), ragline_core::ErrorKind::EmbeddingUnavailable);
  }
}

TEST_F(EmbedderAdapterTest, PermanentFailureIsNotRetried) {
  EXPECT_CALL(*provider_, embed("bad"))
      .Times(1)
      .WillOnce(Throw(ProviderError("model not found", false)));
  EmbedderAdapter adapter(provider_, fast_retry_policy(5));

  try {
    adapter.embed_one("bad");
    FAIL() << "Expected EmbeddingUnavailable";
  } catch (const ragline_core::EmbeddingUnavailable &e) {
    EXPECT_FALSE(e.retryable());
  }
}

TEST_F(EmbedderAdapterTest, DimensionDriftIsRejected) {
  EXPECT_CALL(*provider_, embed("drift")).WillOnce(Return(std::vector<float>{1.0f, 2.0f}));
  EmbedderAdapter adapter(provider_, fast_retry_policy());

  try {
    adapter.embed_batch({"drift"});
    FAIL() << "Expected EmbeddingUnavailable";
  } catch (const ragline_core::EmbeddingUnavailable &e) {
    EXPECT_FALSE(e.retryable());
  }
}

TEST_F(EmbedderAdapterTest, EmptyVectorIsRejected) {
  EXPECT_CALL(*provider_, embed("nothing")).WillOnce(Return(std::vector<float>{}));
  EmbedderAdapter adapter(provider_, fast_retry_policy());

  EXPECT_THROW(adapter.embed_one("nothing"), ragline_core::EmbeddingUnavailable);
}

TEST_F(EmbedderAdapterTest, BatchFailureReturnsNothing) {
  EXPECT_CALL(*provider_, embed("second")).WillOnce(Throw(ProviderError("boom", false)));
  EmbedderAdapter adapter(provider_, fast_retry_policy());

  EXPECT_THROW(adapter.embed_batch({"first", "second", "third"}), ragline_core::EmbeddingUnavailable);
}

TEST_F(EmbedderAdapterTest, UnclassifiedProviderExceptionBecomesEmbeddingUnavailable) {
  EXPECT_CALL(*provider_, embed(EmbedderAdapter::DIMENSION_PROBE_TEXT))
      .WillRepeatedly(Return(std::vector<float>{1.0f, 0.0f}));
  EXPECT_CALL(*provider_, embed("x"))
      .Times(1)
      .WillOnce(Throw(std::runtime_error("[json.exception.parse_error.101] malformed body")));
  EmbedderAdapter adapter(provider_, fast_retry_policy(3));

  try {
    adapter.embed_batch({"x"});
    FAIL() << "Expected EmbeddingUnavailable";
  } catch (const ragline_core::EmbeddingUnavailable &e) {
    EXPECT_FALSE(e.retryable());
    EXPECT_THAT(e.what(), testing::HasSubstr("malformed body"));
  }
}

TEST_F(EmbedderAdapterTest, NonFiniteComponentsAreRejected) {
  EXPECT_CALL(*provider_, embed(EmbedderAdapter::DIMENSION_PROBE_TEXT))
      .WillRepeatedly(Return(std::vector<float>{1.0f, 0.0f}));
  EXPECT_CALL(*provider_, embed("nan"))
      .WillOnce(Return(std::vector<float>{std::numeric_limits<float>::quiet_NaN(), 1.0f}));
  EXPECT_CALL(*provider_, embed("inf"))
      .WillOnce(Return(std::vector<float>{std::numeric_limits<float>::infinity(), 1.0f}));
  EmbedderAdapter adapter(provider_, fast_retry_policy());

  EXPECT_THROW(adapter.embed_one("nan"), ragline_core::EmbeddingUnavailable);
  EXPECT_THROW(adapter.embed_batch({"inf"}), ragline_core::EmbeddingUnavailable);
}

}  // namespace ragline_tests
