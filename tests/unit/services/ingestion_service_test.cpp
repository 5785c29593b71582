#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <filesystem>
#include <memory>
#include <string>

#include "../../common/mocks_test.hpp"
#include "../../common/utilities_test.hpp"
#include "ragkit_core/services/ingestion_service.hpp"

namespace ragkit_core {

using ragkit_tests::MockOllamaClient;
using ragkit_tests::TestUtilities;
using testing::_;
using testing::NiceMock;

class IngestionServiceTest : public ragkit_tests::DocumentStoreTestBase {
 protected:
  void SetUp() override {
    ragkit_tests::DocumentStoreTestBase::SetUp();
    documents_dir_ = TestUtilities::create_temp_dir("ingestion_tests");

    ollama_client_ = std::make_shared<NiceMock<MockOllamaClient>>();
    EmbeddingOptions options;
    options.dimension = ragkit_tests::kTestDimension;
    embedding_generator_ = std::make_shared<EmbeddingGenerator>(ollama_client_, options);
    auto splitter = std::make_shared<ChunkSplitter>(
        ChunkingConfig(200, 40, 20, 400, /*use_semantic_splitting*/ false));

    service_ = std::make_shared<IngestionService>(std::make_shared<ContentExtractorFactory>(),
                                                  splitter, embedding_generator_,
                                                  document_store_);
  }

  void TearDown() override {
    std::filesystem::remove_all(documents_dir_);
    ragkit_tests::DocumentStoreTestBase::TearDown();
  }

  std::string long_text(const std::string& topic, int sentences) {
    std::string text;
    for (int i = 0; i < sentences; ++i) {
      text += "Sentence " + std::to_string(i) + " talks about " + topic + " in some detail. ";
      if (i % 4 == 3) {
        text += "\n\n";
      }
    }
    return text;
  }

  std::filesystem::path documents_dir_;
  std::shared_ptr<NiceMock<MockOllamaClient>> ollama_client_;
  std::shared_ptr<EmbeddingGenerator> embedding_generator_;
  std::shared_ptr<IngestionService> service_;
};

TEST_F(IngestionServiceTest, IngestDocument_StoresChunksWithEmbeddings) {
  auto path = TestUtilities::write_file(documents_dir_ / "guides" / "setup.md",
                                        "# Setup Guide\n\n" + long_text("installation", 16));

  IngestionResult result = service_->ingest_document(path, documents_dir_);

  ASSERT_EQ(result.status, IngestionStatus::Ingested);
  EXPECT_TRUE(result.ok());
  EXPECT_EQ(result.title, "Setup Guide");
  EXPECT_EQ(result.source, "guides/setup.md");
  EXPECT_GT(result.chunks_created, 1);
  EXPECT_GE(result.processing_time_ms, 0.0);

  auto document = document_store_->get(result.document_id);
  ASSERT_TRUE(document.has_value());
  EXPECT_EQ(document->source, "guides/setup.md");
  EXPECT_EQ(document->metadata["file_path"], path.string());
  EXPECT_EQ(document->metadata["content_type"], "text/markdown");

  auto chunks = document_store_->get_chunks(result.document_id);
  ASSERT_EQ(static_cast<int>(chunks.size()), result.chunks_created);
  for (size_t i = 0; i < chunks.size(); ++i) {
    EXPECT_EQ(chunks[i].chunk_index, static_cast<int>(i));
    EXPECT_EQ(chunks[i].vector_embedding.size(), ragkit_tests::kTestDimension);
    EXPECT_LE(chunks[i].content.size(), 400u);
    EXPECT_EQ(chunks[i].content, document->content.substr(chunks[i].start_char,
                                                          chunks[i].end_char - chunks[i].start_char));
  }
}

TEST_F(IngestionServiceTest, Reingest_UnchangedContentIsSkipped) {
  auto path = TestUtilities::write_file(documents_dir_ / "notes.txt", long_text("caching", 8));

  IngestionResult first = service_->ingest_document(path, documents_dir_);
  ASSERT_EQ(first.status, IngestionStatus::Ingested);
  const uint64_t generation = document_store_->generation();

  EXPECT_CALL(*ollama_client_, get_embeddings(_)).Times(0);
  IngestionResult second = service_->ingest_document(path, documents_dir_);
  EXPECT_EQ(second.status, IngestionStatus::Unchanged);
  EXPECT_TRUE(second.ok());
  EXPECT_EQ(second.document_id, first.document_id);
  EXPECT_EQ(document_store_->generation(), generation);
  EXPECT_EQ(document_store_->document_count(), 1);
}

TEST_F(IngestionServiceTest, Reingest_ChangedContentReplacesDocument) {
  auto path = TestUtilities::write_file(documents_dir_ / "notes.txt", long_text("caching", 8));
  IngestionResult first = service_->ingest_document(path, documents_dir_);

  TestUtilities::write_file(path, long_text("eviction policies", 12));
  IngestionResult second = service_->ingest_document(path, documents_dir_);

  ASSERT_EQ(second.status, IngestionStatus::Ingested);
  EXPECT_NE(second.document_id, first.document_id);
  EXPECT_FALSE(document_store_->get(first.document_id).has_value());
  EXPECT_EQ(document_store_->document_count(), 1);
  EXPECT_EQ(document_store_->chunk_count(), second.chunks_created);
  auto stored = document_store_->find_by_source("notes.txt");
  ASSERT_TRUE(stored.has_value());
  EXPECT_NE(stored->content.find("eviction policies"), std::string::npos);
}

TEST_F(IngestionServiceTest, ChangedContent_EmbeddingFailureKeepsPreviousVersion) {
  auto path = TestUtilities::write_file(documents_dir_ / "notes.txt", long_text("caching", 8));
  IngestionResult first = service_->ingest_document(path, documents_dir_);
  ASSERT_EQ(first.status, IngestionStatus::Ingested);
  const long long chunks_before = document_store_->chunk_count();

  TestUtilities::write_file(path, long_text("eviction policies", 12));
  ON_CALL(*ollama_client_, get_embeddings(_))
      .WillByDefault(testing::Throw(OllamaError("connection refused")));
  EXPECT_THROW(service_->ingest_document(path, documents_dir_), EmbeddingError);

  auto stored = document_store_->find_by_source("notes.txt");
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->id, first.document_id);
  EXPECT_NE(stored->content.find("caching"), std::string::npos);
  EXPECT_EQ(document_store_->chunk_count(), chunks_before);
}

TEST_F(IngestionServiceTest, ChangedContent_CancellationKeepsPreviousVersion) {
  IngestionResult first = service_->ingest_text("Notes", "notes", long_text("caching", 8));
  ASSERT_EQ(first.status, IngestionStatus::Ingested);

  async::CancellationToken token;
  token.cancel();
  EXPECT_THROW(service_->ingest_text("Notes", "notes", long_text("sharding", 8),
                                    nlohmann::json::object(), token),
               async::CancelledError);

  auto stored = document_store_->find_by_source("notes");
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->id, first.document_id);
  EXPECT_EQ(document_store_->document_count(), 1);
}

TEST_F(IngestionServiceTest, BlankDocument_IsReportedEmpty) {
  auto path = TestUtilities::write_file(documents_dir_ / "blank.txt", "  \n\n\t ");

  IngestionResult result = service_->ingest_document(path, documents_dir_);
  EXPECT_EQ(result.status, IngestionStatus::Empty);
  EXPECT_TRUE(result.ok());
  EXPECT_EQ(result.chunks_created, 0);
  EXPECT_EQ(document_store_->document_count(), 0);
}

TEST_F(IngestionServiceTest, FileOutsideRoot_UsesFullPathAsSource) {
  auto other_dir = TestUtilities::create_temp_dir("ingestion_elsewhere");
  auto path = TestUtilities::write_file(other_dir / "outside.txt", long_text("paths", 4));

  IngestionResult result = service_->ingest_document(path, documents_dir_);
  EXPECT_EQ(result.source, path.generic_string());
  EXPECT_EQ(result.title, "outside");
  std::filesystem::remove_all(other_dir);
}

TEST_F(IngestionServiceTest, EmbeddingFailure_StoresNothing) {
  ON_CALL(*ollama_client_, get_embeddings(_))
      .WillByDefault(testing::Throw(OllamaError("connection refused")));
  auto path = TestUtilities::write_file(documents_dir_ / "doc.txt", long_text("failures", 6));

  EXPECT_THROW(service_->ingest_document(path, documents_dir_), EmbeddingError);
  EXPECT_EQ(document_store_->document_count(), 0);
}

TEST_F(IngestionServiceTest, UnsupportedFile_Throws) {
  auto path = TestUtilities::write_file(documents_dir_ / "image.png", "not really a png");
  EXPECT_THROW(service_->ingest_document(path, documents_dir_), ExtractionError);
}

TEST_F(IngestionServiceTest, CancelledToken_StopsBeforeExtraction) {
  auto path = TestUtilities::write_file(documents_dir_ / "doc.txt", long_text("cancel", 6));
  async::CancellationToken token;
  token.cancel();

  EXPECT_THROW(service_->ingest_document(path, documents_dir_, token), async::CancelledError);
  EXPECT_EQ(document_store_->document_count(), 0);
}

TEST_F(IngestionServiceTest, IngestText_StoresGivenTitleAndSource) {
  IngestionResult result = service_->ingest_text("Inline", "inline://one", long_text("inline", 5),
                                                 {{"origin", "api"}});
  ASSERT_EQ(result.status, IngestionStatus::Ingested);

  auto document = document_store_->get(result.document_id);
  ASSERT_TRUE(document.has_value());
  EXPECT_EQ(document->title, "Inline");
  EXPECT_EQ(document->metadata["origin"], "api");
}

TEST_F(IngestionServiceTest, DiscoverDocuments_ListsSupportedFilesSorted) {
  TestUtilities::write_file(documents_dir_ / "b.md", "b");
  TestUtilities::write_file(documents_dir_ / "a.txt", "a");
  TestUtilities::write_file(documents_dir_ / "skip.png", "x");
  TestUtilities::write_file(documents_dir_ / "nested" / "c.md", "c");

  auto recursive = service_->discover_documents(documents_dir_);
  ASSERT_EQ(recursive.size(), 3u);
  EXPECT_EQ(recursive[0], documents_dir_ / "a.txt");
  EXPECT_EQ(recursive[1], documents_dir_ / "b.md");
  EXPECT_EQ(recursive[2], documents_dir_ / "nested" / "c.md");

  auto flat = service_->discover_documents(documents_dir_, false);
  EXPECT_EQ(flat.size(), 2u);
}

TEST_F(IngestionServiceTest, DiscoverDocuments_MissingFolderThrows) {
  EXPECT_THROW(service_->discover_documents(documents_dir_ / "missing"), ExtractionError);
}

TEST_F(IngestionServiceTest, Clean_RemovesEverything) {
  service_->ingest_text("One", "one", long_text("one", 4));
  service_->ingest_text("Two", "two", long_text("two", 4));

  service_->clean();
  EXPECT_EQ(document_store_->document_count(), 0);
  EXPECT_EQ(document_store_->chunk_count(), 0);
}

TEST(IngestionStatusTest, HasLowercaseNames) {
  EXPECT_EQ(to_string(IngestionStatus::Ingested), "ingested");
  EXPECT_EQ(to_string(IngestionStatus::Unchanged), "unchanged");
  EXPECT_EQ(to_string(IngestionStatus::Empty), "empty");
  EXPECT_EQ(to_string(IngestionStatus::Failed), "failed");
}

}  // namespace ragkit_core
