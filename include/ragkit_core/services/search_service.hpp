#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "ragkit_core/async/cancellation_token.hpp"
#include "ragkit_core/db/document_store.hpp"
#include "ragkit_core/embedding/embedding_generator.hpp"
#include "ragkit_core/retrieval/retrieval_engine.hpp"
#include "ragkit_core/types/search_result.hpp"

namespace ragkit_core {

struct DocumentWithChunks {
  Document document;
  std::vector<Chunk> chunks;
};

class SearchService {
 public:
  SearchService(std::shared_ptr<const EmbeddingGenerator> embedding_generator,
                std::shared_ptr<RetrievalEngine> retrieval_engine,
                std::shared_ptr<DocumentStore> document_store);

  virtual ~SearchService() = default;

  // Embeds the query text, then searches. EmbeddingError and RetrievalError
  // propagate to the caller.
  virtual std::vector<SearchResult> vector_search(const std::string& query,
                                                  int limit = 10,
                                                  const async::CancellationToken& token = {});
  virtual std::vector<SearchResult> lexical_search(const std::string& query,
                                                   int limit = 10,
                                                   const async::CancellationToken& token = {});
  virtual std::vector<SearchResult> hybrid_search(const std::string& query,
                                                  int limit = 10,
                                                  float text_weight = 0.3f,
                                                  const async::CancellationToken& token = {});

  virtual std::optional<DocumentWithChunks> get_document(long long document_id);
  virtual std::vector<DocumentSummary> list_documents(int limit = 20, int offset = 0);

 private:
  std::vector<float> embed_query(const std::string& query, const async::CancellationToken& token);

  std::shared_ptr<const EmbeddingGenerator> embedding_generator_;
  std::shared_ptr<RetrievalEngine> retrieval_engine_;
  std::shared_ptr<DocumentStore> document_store_;
};

}  // namespace ragkit_core
