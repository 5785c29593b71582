#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <string>

#include "../../common/mocks_test.hpp"
#include "ragkit_core/chunking/chunk_splitter.hpp"
#include "ragkit_core/embedding/embedding_generator.hpp"

namespace ragkit_tests {

using namespace ragkit_core;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Throw;

namespace {

std::string sample_text(size_t target_length) {
  const std::vector<std::string> sentences = {
      "Retrieval systems split documents into chunks. ",
      "Each chunk is embedded and stored with its offsets.\n",
      "Queries are matched against those chunks! ",
      "Does the overlap help keep context? It usually does.\n\n"};
  std::string text;
  for (size_t i = 0; text.size() < target_length; ++i) {
    text += sentences[i % sentences.size()];
  }
  return text;
}

void expect_chunk_invariants(const std::string& content,
                             const std::vector<Chunk>& chunks,
                             size_t max_size) {
  for (size_t i = 0; i < chunks.size(); ++i) {
    const Chunk& chunk = chunks[i];
    EXPECT_EQ(chunk.chunk_index, static_cast<int>(i));
    EXPECT_LE(chunk.content.size(), max_size);
    EXPECT_LT(chunk.start_char, chunk.end_char);
    EXPECT_EQ(chunk.content, content.substr(chunk.start_char, chunk.end_char - chunk.start_char));
    EXPECT_EQ(chunk.metadata["chunk_index"], static_cast<int>(i));
    EXPECT_EQ(chunk.metadata["total_chunks"], static_cast<int>(chunks.size()));
    EXPECT_GE(chunk.token_count, 1);
    EXPECT_FALSE(chunk.has_embedding());
  }
}

}  // namespace

TEST(ChunkSplitterTest, EmptyContentGivesNoChunks) {
  ChunkSplitter splitter(ChunkingConfig(100, 10, 10, 200, false));
  EXPECT_TRUE(splitter.split("").empty());
  EXPECT_TRUE(splitter.split(" \n\t ").empty());
}

TEST(ChunkSplitterTest, StructuralChunksKeepInvariants) {
  ChunkSplitter splitter(ChunkingConfig(300, 60, 50, 400, false));
  EXPECT_EQ(splitter.strategy(), SplitStrategy::Structural);

  const std::string content = sample_text(5000);
  auto chunks = splitter.split(content, "Guide", "docs/guide.md", {{"author", "me"}});

  ASSERT_GT(chunks.size(), 1u);
  expect_chunk_invariants(content, chunks, 400);
  EXPECT_EQ(chunks[0].metadata["title"], "Guide");
  EXPECT_EQ(chunks[0].metadata["source"], "docs/guide.md");
  EXPECT_EQ(chunks[0].metadata["author"], "me");
  EXPECT_EQ(chunks[0].metadata["chunk_method"], "structural");
}

TEST(ChunkSplitterTest, TwentySixHundredCharacterScenario) {
  ChunkSplitter splitter(ChunkingConfig(1000, 200, 100, 1000, false));
  const std::string content = sample_text(2600).substr(0, 2600);
  auto chunks = splitter.split(content);

  ASSERT_GE(chunks.size(), 3u);
  expect_chunk_invariants(content, chunks, 1000);
  for (size_t i = 1; i < chunks.size(); ++i) {
    EXPECT_LE(chunks[i].start_char, chunks[i - 1].end_char);
    EXPECT_LE(chunks[i - 1].end_char - chunks[i].start_char, 200u);
  }
}

TEST(ChunkSplitterTest, StructuralSplittingIsDeterministic) {
  ChunkSplitter splitter(ChunkingConfig(250, 40, 20, 300, false));
  const std::string content = sample_text(3000);
  auto first = splitter.split(content);
  auto second = splitter.split(content);
  ASSERT_EQ(first.size(), second.size());
  for (size_t i = 0; i < first.size(); ++i) {
    EXPECT_EQ(first[i].start_char, second[i].start_char);
    EXPECT_EQ(first[i].end_char, second[i].end_char);
  }
}

TEST(ChunkSplitterTest, SmallSegmentsAreMergedIntoNeighbours) {
  ChunkSplitter splitter(ChunkingConfig(50, 0, 30, 100, false));
  const std::string content = "Short one.\n\n" + std::string(45, 'p') + "\n\nTiny.";
  auto chunks = splitter.split(content);

  ASSERT_EQ(chunks.size(), 1u);
  EXPECT_EQ(chunks[0].content, content);
}

TEST(ChunkSplitterTest, UndersizedSegmentIsKeptWhenMergingWouldExceedMax) {
  ChunkSplitter splitter(ChunkingConfig(50, 0, 10, 50, false));
  const std::string content = std::string(48, 'a') + "\n\nb";
  auto chunks = splitter.split(content);

  ASSERT_EQ(chunks.size(), 2u);
  EXPECT_EQ(chunks[1].content, "b");
  expect_chunk_invariants(content, chunks, 50);
}

TEST(ChunkSplitterTest, SmallestMaximumStillHoldsWholeCodePoints) {
  ChunkSplitter splitter(ChunkingConfig(4, 0, 1, ChunkingConfig::MIN_MAX_CHUNK_SIZE, false));
  const std::string content = "ab\xF0\x9F\x98\x80\xF0\x9F\x98\x80\xC3\xA9";
  auto chunks = splitter.split(content);

  ASSERT_GE(chunks.size(), 3u);
  expect_chunk_invariants(content, chunks, 4);
  for (const Chunk& chunk : chunks) {
    const auto lead = static_cast<unsigned char>(chunk.content.front());
    EXPECT_NE(lead & 0xC0, 0x80) << "chunk " << chunk.chunk_index << " starts mid code point";
  }
}

class ChunkSplitterSemanticTest : public ::testing::Test {
 protected:
  void SetUp() override {
    client_ = std::make_shared<NiceMock<MockOllamaClient>>();
    EmbeddingOptions options;
    options.dimension = kTestDimension;
    generator_ = std::make_shared<EmbeddingGenerator>(client_, options);
  }

  std::shared_ptr<NiceMock<MockOllamaClient>> client_;
  std::shared_ptr<EmbeddingGenerator> generator_;
};

TEST_F(ChunkSplitterSemanticTest, UsesSemanticStrategyWhenAvailable) {
  ChunkSplitter splitter(ChunkingConfig(200, 20, 5, 400, true, SemanticOptions{95.0, 0}),
                         generator_);
  EXPECT_EQ(splitter.strategy(), SplitStrategy::Semantic);

  const std::string content = sample_text(1200);
  auto chunks = splitter.split(content);
  ASSERT_FALSE(chunks.empty());
  expect_chunk_invariants(content, chunks, 400);
  EXPECT_EQ(chunks[0].metadata["chunk_method"], "semantic");
}

TEST_F(ChunkSplitterSemanticTest, FallsBackToStructuralOnEmbeddingFailure) {
  EXPECT_CALL(*client_, get_embeddings(_)).WillOnce(Throw(OllamaError("model not found")));
  ChunkSplitter splitter(ChunkingConfig(200, 20, 5, 400, true), generator_);

  const std::string content = sample_text(1200);
  auto chunks = splitter.split(content);
  ASSERT_FALSE(chunks.empty());
  expect_chunk_invariants(content, chunks, 400);
  EXPECT_EQ(chunks[0].metadata["chunk_method"], "structural");
}

TEST_F(ChunkSplitterSemanticTest, OversizedSemanticGroupsAreResplit) {
  // Every window embeds to the same vector, so all sentences form one group.
  ON_CALL(*client_, get_embeddings(_))
      .WillByDefault([](const std::vector<std::string>& texts) {
        return std::vector<std::vector<float>>(texts.size(), TestUtilities::axis_vector(0));
      });
  ChunkSplitter splitter(ChunkingConfig(150, 30, 10, 200, true), generator_);

  const std::string content = sample_text(2000);
  auto chunks = splitter.split(content);
  ASSERT_GT(chunks.size(), 1u);
  expect_chunk_invariants(content, chunks, 200);
}

}  // namespace ragkit_tests
