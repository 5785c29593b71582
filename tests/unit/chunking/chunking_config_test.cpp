#include <gtest/gtest.h>

#include "ragkit_core/chunking/chunking_config.hpp"

namespace ragkit_core {

TEST(ChunkingConfigTest, DefaultsAreValid) {
  ChunkingConfig config;
  EXPECT_EQ(config.chunk_size(), 1000);
  EXPECT_EQ(config.chunk_overlap(), 200);
  EXPECT_EQ(config.min_chunk_size(), 100);
  EXPECT_EQ(config.max_chunk_size(), 2000);
  EXPECT_TRUE(config.use_semantic_splitting());
}

TEST(ChunkingConfigTest, RejectsNonPositiveChunkSize) {
  EXPECT_THROW(ChunkingConfig(0, 0), ConfigError);
  EXPECT_THROW(ChunkingConfig(-5, 0), ConfigError);
}

TEST(ChunkingConfigTest, RejectsOverlapNotBelowChunkSize) {
  EXPECT_THROW(ChunkingConfig(100, 100), ConfigError);
  EXPECT_THROW(ChunkingConfig(100, 150), ConfigError);
  EXPECT_NO_THROW(ChunkingConfig(100, 99, 10, 200));
}

TEST(ChunkingConfigTest, RejectsNegativeOverlap) {
  EXPECT_THROW(ChunkingConfig(100, -1), ConfigError);
}

TEST(ChunkingConfigTest, RejectsNonPositiveMinimum) {
  EXPECT_THROW(ChunkingConfig(100, 10, 0, 200), ConfigError);
}

TEST(ChunkingConfigTest, RejectsMaximumBelowMinimum) {
  EXPECT_THROW(ChunkingConfig(100, 10, 50, 40), ConfigError);
}

TEST(ChunkingConfigTest, RejectsMaximumNarrowerThanOneCodePoint) {
  EXPECT_THROW(ChunkingConfig(3, 0, 1, 3), ConfigError);
  EXPECT_THROW(ChunkingConfig(2, 1, 2, 2), ConfigError);
  EXPECT_NO_THROW(ChunkingConfig(4, 0, 1, 4));
}

TEST(ChunkingConfigTest, RejectsBadSemanticOptions) {
  EXPECT_THROW(ChunkingConfig(100, 10, 10, 200, true, SemanticOptions{0.0, 1}), ConfigError);
  EXPECT_THROW(ChunkingConfig(100, 10, 10, 200, true, SemanticOptions{101.0, 1}), ConfigError);
  EXPECT_THROW(ChunkingConfig(100, 10, 10, 200, true, SemanticOptions{95.0, -1}), ConfigError);
}

TEST(ChunkingConfigTest, ErrorMessageNamesTheProblem) {
  try {
    ChunkingConfig(100, 100);
    FAIL() << "Expected ConfigError";
  } catch (const ConfigError& e) {
    EXPECT_STREQ(e.what(), "Chunk overlap must be less than chunk size");
  }
}

}  // namespace ragkit_core
