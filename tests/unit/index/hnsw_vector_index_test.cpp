#include <gtest/gtest.h>

#include <random>
#include <vector>

#include "../../common/utilities_test.hpp"
#include "ragline_core/errors.hpp"
#include "ragline_core/index/hnsw_vector_index.hpp"

namespace ragline_tests {

using ragline_core::HnswVectorIndex;
using ragline_core::Metric;

class HnswVectorIndexTest : public ::testing::Test {
 protected:
  static std::vector<float> random_vector(std::mt19937 &rng, size_t dimension) {
    std::uniform_real_distribution<float> dist(-1.0f, 1.0f);
    std::vector<float> vector(dimension);
    for (auto &value : vector) {
      value = dist(rng);
    }
    return vector;
  }
};

TEST_F(HnswVectorIndexTest, FindsExactMatchAmongManyVectors) {
  constexpr size_t kDimension = 16;
  HnswVectorIndex index(kDimension, Metric::L2);
  std::mt19937 rng(42);

  std::vector<ragline_core::VectorIndexEntry> entries;
  std::vector<std::vector<float>> vectors;
  for (int i = 0; i < 200; ++i) {
    vectors.push_back(random_vector(rng, kDimension));
    entries.push_back(TestUtilities::make_entry(vectors.back(), "vector " + std::to_string(i)));
  }
  index.insert(std::move(entries));

  ragline_core::RetrievalResult results = index.query(vectors[137], 5);

  ASSERT_FALSE(results.empty());
  EXPECT_EQ(results[0].fragment.text, "vector 137");
  EXPECT_NEAR(results[0].distance, 0.0f, 1e-5);
  for (size_t i = 1; i < results.size(); ++i) {
    EXPECT_LE(results[i - 1].distance, results[i].distance);
  }
}

TEST_F(HnswVectorIndexTest, CosineDistancesMatchFlatConvention) {
  HnswVectorIndex index(2, Metric::Cosine);
  index.insert({TestUtilities::make_entry({10.0f, 0.0f}, "x"),
                TestUtilities::make_entry({0.0f, 3.0f}, "y")});

  ragline_core::RetrievalResult results = index.query({1.0f, 0.0f}, 2);

  ASSERT_EQ(results.size(), 2u);
  EXPECT_EQ(results[0].fragment.text, "x");
  EXPECT_NEAR(results[0].distance, 0.0f, 1e-5);
  EXPECT_NEAR(results[1].distance, 1.0f, 1e-5);
  // Stored payloads keep the original, unnormalized embedding.
  EXPECT_EQ(results[0].fragment.embedding, (std::vector<float>{10.0f, 0.0f}));
}

TEST_F(HnswVectorIndexTest, DotDistancesAreNegatedInnerProducts) {
  HnswVectorIndex index(2, Metric::Dot);
  index.insert({TestUtilities::make_entry({1.0f, 0.0f}, "small"),
                TestUtilities::make_entry({4.0f, 0.0f}, "large")});

  ragline_core::RetrievalResult results = index.query({1.0f, 0.0f}, 2);

  ASSERT_EQ(results.size(), 2u);
  EXPECT_EQ(results[0].fragment.text, "large");
  EXPECT_FLOAT_EQ(results[0].distance, -4.0f);
}

TEST_F(HnswVectorIndexTest, SharesTheIndexContract) {
  HnswVectorIndex index(3, Metric::L2);
  EXPECT_THROW(index.query({1.0f, 0.0f, 0.0f}, 1), ragline_core::EmptyIndex);

  std::vector<ragline_core::FragmentId> ids =
      index.insert({TestUtilities::make_entry(TestUtilities::axis_vector(3, 0), "a"),
                    TestUtilities::make_entry(TestUtilities::axis_vector(3, 1), "b")});
  EXPECT_EQ(ids, (std::vector<ragline_core::FragmentId>{1, 2}));
  EXPECT_EQ(index.size(), 2u);
  EXPECT_EQ(index.kind(), ragline_core::IndexKind::Hnsw);

  EXPECT_THROW(index.query({1.0f}, 1), ragline_core::DimensionMismatch);
  EXPECT_THROW(index.query({1.0f, 0.0f, 0.0f}, -1), std::invalid_argument);
  EXPECT_THROW(index.insert({TestUtilities::make_entry({1.0f}, "bad")}),
               ragline_core::DimensionMismatch);
  EXPECT_EQ(index.size(), 2u);

  std::vector<ragline_core::Fragment> entries = index.entries();
  ASSERT_EQ(entries.size(), 2u);
  EXPECT_EQ(entries[0].text, "a");
  EXPECT_EQ(entries[1].id, 2);
}

TEST_F(HnswVectorIndexTest, RejectsDuplicateIds) {
  HnswVectorIndex index(2, Metric::L2);
  index.insert({TestUtilities::make_entry({1.0f, 0.0f}, "a")});

  ragline_core::VectorIndexEntry duplicate = TestUtilities::make_entry({0.0f, 1.0f}, "b");
  duplicate.fragment_id = 1;
  EXPECT_THROW(index.insert({duplicate}), std::invalid_argument);
  EXPECT_EQ(index.size(), 1u);
}

TEST(VectorIndexFactoryTest, CreatesRequestedBackend) {
  auto flat = ragline_core::make_vector_index(ragline_core::IndexKind::Flat, 4, Metric::Cosine);
  auto hnsw = ragline_core::make_vector_index(ragline_core::IndexKind::Hnsw, 4, Metric::L2);

  EXPECT_EQ(flat->kind(), ragline_core::IndexKind::Flat);
  EXPECT_EQ(flat->metric(), Metric::Cosine);
  EXPECT_EQ(hnsw->kind(), ragline_core::IndexKind::Hnsw);
  EXPECT_EQ(hnsw->dimension(), 4u);
}

TEST(VectorIndexFactoryTest, ParsesNamesCaseInsensitively) {
  EXPECT_EQ(ragline_core::metric_from_string("Cosine"), Metric::Cosine);
  EXPECT_EQ(ragline_core::metric_from_string("l2"), Metric::L2);
  EXPECT_EQ(ragline_core::index_kind_from_string("HNSW"), ragline_core::IndexKind::Hnsw);
  EXPECT_EQ(ragline_core::to_string(Metric::Dot), "dot");
  EXPECT_THROW(ragline_core::metric_from_string("manhattan"), ragline_core::InvalidConfiguration);
  EXPECT_THROW(ragline_core::index_kind_from_string("ivf"), ragline_core::InvalidConfiguration);
}

}  // namespace ragline_tests
