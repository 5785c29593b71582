#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>

#include "../../common/mocks_test.hpp"
#include "ragkit_core/chunking/semantic_splitter.hpp"
#include "ragkit_core/embedding/embedding_generator.hpp"

namespace ragkit_tests {

using namespace ragkit_core;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Throw;

namespace {

// Two clearly separated topics: sentences about cats point along one axis,
// sentences about stocks along another.
std::vector<std::vector<float>> topic_vectors(const std::vector<std::string>& texts) {
  std::vector<std::vector<float>> vectors;
  for (const auto& text : texts) {
    const bool cats = text.find("Cats") != std::string::npos;
    const bool stocks = text.find("Stocks") != std::string::npos;
    std::vector<float> v(kTestDimension, 0.0f);
    v[0] = cats ? 1.0f : 0.0f;
    v[1] = stocks ? 1.0f : 0.0f;
    v[2] = (!cats && !stocks) ? 1.0f : 0.0f;
    vectors.push_back(v);
  }
  return vectors;
}

}  // namespace

class SemanticSplitterTest : public ::testing::Test {
 protected:
  void SetUp() override {
    client_ = std::make_shared<NiceMock<MockOllamaClient>>();
    EmbeddingOptions options;
    options.dimension = kTestDimension;
    generator_ = std::make_unique<EmbeddingGenerator>(client_, options);
  }

  std::shared_ptr<NiceMock<MockOllamaClient>> client_;
  std::unique_ptr<EmbeddingGenerator> generator_;
};

TEST_F(SemanticSplitterTest, DetectsSentencesOnPunctuationAndNewlines) {
  const std::string text = "First one. Second one!\nThird line without stop\nv1.2 stays whole? Yes";
  auto sentences = SemanticSplitter::detect_sentences(text);
  std::vector<std::string> contents;
  for (const auto& s : sentences) {
    contents.push_back(text.substr(s.start, s.length()));
  }
  EXPECT_THAT(contents, ::testing::ElementsAre("First one.", "Second one!",
                                               "Third line without stop",
                                               "v1.2 stays whole?", "Yes"));
}

TEST_F(SemanticSplitterTest, SplitsWhereTheTopicChanges) {
  ON_CALL(*client_, get_embeddings(_)).WillByDefault(topic_vectors);
  SemanticSplitter splitter(*generator_, SemanticOptions{95.0, 0});

  const std::string text =
      "Cats purr softly. Cats chase mice. Stocks rose today. Stocks fell later.";
  auto groups = splitter.split(text);

  ASSERT_TRUE(groups.has_value());
  ASSERT_EQ(groups->size(), 2u);
  EXPECT_EQ(text.substr((*groups)[0].start, (*groups)[0].length()),
            "Cats purr softly. Cats chase mice.");
  EXPECT_EQ(text.substr((*groups)[1].start, (*groups)[1].length()),
            "Stocks rose today. Stocks fell later.");
}

TEST_F(SemanticSplitterTest, TooFewSentencesGiveNoSignal) {
  EXPECT_CALL(*client_, get_embeddings(_)).Times(0);
  SemanticSplitter splitter(*generator_, SemanticOptions{});
  EXPECT_FALSE(splitter.split("Only one sentence. And a second.").has_value());
}

TEST_F(SemanticSplitterTest, EmbeddingFailureGivesNoSignal) {
  EXPECT_CALL(*client_, get_embeddings(_)).WillOnce(Throw(OllamaError("connection refused")));
  SemanticSplitter splitter(*generator_, SemanticOptions{});
  EXPECT_FALSE(splitter.split("One. Two. Three. Four.").has_value());
}

TEST(SemanticMathTest, PercentileInterpolates) {
  EXPECT_DOUBLE_EQ(percentile({1.0, 2.0, 3.0, 4.0, 5.0}, 50.0), 3.0);
  EXPECT_DOUBLE_EQ(percentile({0.0, 10.0}, 95.0), 9.5);
  EXPECT_DOUBLE_EQ(percentile({7.0}, 95.0), 7.0);
}

TEST(SemanticMathTest, CosineDistance) {
  EXPECT_NEAR(cosine_distance({1.0f, 0.0f}, {1.0f, 0.0f}), 0.0, 1e-9);
  EXPECT_NEAR(cosine_distance({1.0f, 0.0f}, {0.0f, 1.0f}), 1.0, 1e-9);
  EXPECT_NEAR(cosine_distance({0.0f, 0.0f}, {0.0f, 1.0f}), 1.0, 1e-9);
}

}  // namespace ragkit_tests
