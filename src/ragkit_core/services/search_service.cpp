#include "ragkit_core/services/search_service.hpp"

namespace ragkit_core {

SearchService::SearchService(std::shared_ptr<const EmbeddingGenerator> embedding_generator,
                             std::shared_ptr<RetrievalEngine> retrieval_engine,
                             std::shared_ptr<DocumentStore> document_store)
    : embedding_generator_(std::move(embedding_generator)),
      retrieval_engine_(std::move(retrieval_engine)),
      document_store_(std::move(document_store)) {}

std::vector<float> SearchService::embed_query(const std::string& query,
                                              const async::CancellationToken& token) {
  if (query.empty()) {
    throw RetrievalError("Query must not be empty");
  }
  token.throw_if_cancelled("before query embedding");
  std::vector<float> query_embedding = embedding_generator_->embed_query(query, token);
  token.throw_if_cancelled("after query embedding");
  return query_embedding;
}

std::vector<SearchResult> SearchService::vector_search(const std::string& query,
                                                       int limit,
                                                       const async::CancellationToken& token) {
  std::vector<float> query_embedding = embed_query(query, token);
  return retrieval_engine_->vector_search(query_embedding, limit);
}

std::vector<SearchResult> SearchService::lexical_search(const std::string& query,
                                                        int limit,
                                                        const async::CancellationToken& token) {
  token.throw_if_cancelled("lexical search");
  return retrieval_engine_->lexical_search(query, limit);
}

std::vector<SearchResult> SearchService::hybrid_search(const std::string& query,
                                                       int limit,
                                                       float text_weight,
                                                       const async::CancellationToken& token) {
  std::vector<float> query_embedding = embed_query(query, token);
  return retrieval_engine_->hybrid_search(query_embedding, query, limit, text_weight);
}

std::optional<DocumentWithChunks> SearchService::get_document(long long document_id) {
  std::optional<Document> document = document_store_->get(document_id);
  if (!document) {
    return std::nullopt;
  }
  return DocumentWithChunks{std::move(*document), document_store_->get_chunks(document_id)};
}

std::vector<DocumentSummary> SearchService::list_documents(int limit, int offset) {
  return document_store_->list(limit, offset);
}

}  // namespace ragkit_core
