#pragma once

#include <filesystem>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "ragkit_core/async/cancellation_token.hpp"
#include "ragkit_core/chunking/chunk_splitter.hpp"
#include "ragkit_core/db/document_store.hpp"
#include "ragkit_core/embedding/embedding_generator.hpp"
#include "ragkit_core/extractors/content_extractor_factory.hpp"

namespace ragkit_core {

enum class IngestionStatus { Ingested, Unchanged, Empty, Failed };

std::string to_string(IngestionStatus status);

struct IngestionResult {
  IngestionStatus status = IngestionStatus::Failed;
  long long document_id = 0;
  std::string title;
  std::string source;
  int chunks_created = 0;
  double processing_time_ms = 0.0;
  std::vector<std::string> errors;

  bool ok() const {
    return status != IngestionStatus::Failed;
  }
};

/**
 * @class IngestionService
 * @brief Runs one document through extract, hash, split, embed and save.
 *
 * The steps of a document are strictly sequential. A source whose content
 * hash is unchanged is skipped; a changed source replaces the stored
 * document. Errors are not caught here; batch callers decide what a failure
 * means for the rest of the run.
 */
class IngestionService {
 public:
  IngestionService(std::shared_ptr<ContentExtractorFactory> extractor_factory,
                   std::shared_ptr<const ChunkSplitter> splitter,
                   std::shared_ptr<const EmbeddingGenerator> embedding_generator,
                   std::shared_ptr<DocumentStore> document_store);

  virtual ~IngestionService() = default;

  // The stored source is the path relative to documents_root when the file
  // lives under it, otherwise the path as given.
  virtual IngestionResult ingest_document(const std::filesystem::path& file_path,
                                          const std::filesystem::path& documents_root = {},
                                          const async::CancellationToken& token = {});

  IngestionResult ingest_text(const std::string& title,
                              const std::string& source,
                              const std::string& content,
                              const nlohmann::json& metadata = nlohmann::json::object(),
                              const async::CancellationToken& token = {});

  /**
   * @brief Lists the files under folder that an extractor can handle.
   * @return Paths sorted lexicographically.
   * @throw ExtractionError if folder does not exist or is not a directory.
   */
  std::vector<std::filesystem::path> discover_documents(const std::filesystem::path& folder,
                                                        bool recursive = true) const;

  // Removes every document and chunk.
  void clean();

 private:
  static std::string source_for(const std::filesystem::path& file_path,
                                const std::filesystem::path& documents_root);

  std::shared_ptr<ContentExtractorFactory> extractor_factory_;
  std::shared_ptr<const ChunkSplitter> splitter_;
  std::shared_ptr<const EmbeddingGenerator> embedding_generator_;
  std::shared_ptr<DocumentStore> document_store_;
};

}  // namespace ragkit_core
