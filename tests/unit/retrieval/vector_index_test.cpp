#include <gtest/gtest.h>

#include <cmath>
#include <stdexcept>
#include <vector>

#include "ragkit_core/retrieval/vector_index.hpp"

namespace ragkit_core {

TEST(VectorIndexTest, RejectsZeroDimension) {
  EXPECT_THROW(VectorIndex index(0), std::invalid_argument);
}

TEST(VectorIndexTest, SearchRanksByCosineSimilarity) {
  VectorIndex index(3);
  index.add(10, {1.0f, 0.0f, 0.0f});
  index.add(20, {0.7f, 0.7f, 0.0f});
  index.add(30, {0.0f, 0.0f, 5.0f});

  auto hits = index.search({2.0f, 0.0f, 0.0f}, 3);
  ASSERT_EQ(hits.size(), 3u);
  EXPECT_EQ(hits[0].first, 10);
  EXPECT_NEAR(hits[0].second, 1.0f, 1e-5);
  EXPECT_EQ(hits[1].first, 20);
  EXPECT_NEAR(hits[1].second, std::sqrt(0.5f), 1e-5);
  EXPECT_EQ(hits[2].first, 30);
  EXPECT_NEAR(hits[2].second, 0.0f, 1e-5);
}

TEST(VectorIndexTest, MagnitudeDoesNotAffectScore) {
  VectorIndex index(2);
  index.add(1, {0.001f, 0.001f});
  index.add(2, {100.0f, 0.0f});

  auto hits = index.search({1.0f, 1.0f}, 1);
  ASSERT_EQ(hits.size(), 1u);
  EXPECT_EQ(hits[0].first, 1);
}

TEST(VectorIndexTest, TiesAreBrokenByIdAscending) {
  VectorIndex index(2);
  index.add(9, {1.0f, 0.0f});
  index.add(3, {1.0f, 0.0f});
  index.add(5, {1.0f, 0.0f});

  auto hits = index.search({1.0f, 0.0f}, 2);
  ASSERT_EQ(hits.size(), 2u);
  EXPECT_EQ(hits[0].first, 3);
  EXPECT_EQ(hits[1].first, 5);
}

TEST(VectorIndexTest, EmptyIndexAndZeroK_ReturnNothing) {
  VectorIndex index(2);
  EXPECT_TRUE(index.search({1.0f, 0.0f}, 5).empty());
  index.add(1, {1.0f, 0.0f});
  EXPECT_TRUE(index.search({1.0f, 0.0f}, 0).empty());
}

TEST(VectorIndexTest, RejectsWrongDimensions) {
  VectorIndex index(3);
  EXPECT_THROW(index.add(1, {1.0f, 0.0f}), std::invalid_argument);
  index.add(1, {1.0f, 0.0f, 0.0f});
  EXPECT_THROW(index.search({1.0f}, 1), std::invalid_argument);
}

TEST(VectorIndexTest, SimilarityOfUnknownIdIsZero) {
  VectorIndex index(2);
  index.add(1, {0.0f, 3.0f});
  auto query = index.normalize({0.0f, 2.0f});
  EXPECT_NEAR(index.similarity(1, query), 1.0f, 1e-5);
  EXPECT_EQ(index.similarity(2, query), 0.0f);
  EXPECT_EQ(index.size(), 1u);
}

}  // namespace ragkit_core
