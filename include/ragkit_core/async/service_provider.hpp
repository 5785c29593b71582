#pragma once

#include <memory>

namespace ragkit_core {
class DatabaseManager;
class OllamaClient;
class EmbeddingGenerator;
class DocumentStore;
class RetrievalEngine;
class ContentExtractorFactory;
class IngestionService;
class SearchService;
namespace async {
class ConcurrencyLimiter;
}
}  // namespace ragkit_core

namespace ragkit_core {

/**
 * @class ServiceProvider
 * @brief Explicitly built context that owns the shared services.
 *
 * main() wires one of these up and hands it to the worker pool and the HTTP
 * routes. Tests build one from mocks; services a test does not touch may be
 * left null.
 */
class ServiceProvider {
 public:
  struct Services {
    std::shared_ptr<DatabaseManager> database_manager;
    std::shared_ptr<OllamaClient> ollama_client;
    std::shared_ptr<async::ConcurrencyLimiter> embedding_limiter;
    std::shared_ptr<EmbeddingGenerator> embedding_generator;
    std::shared_ptr<DocumentStore> document_store;
    std::shared_ptr<RetrievalEngine> retrieval_engine;
    std::shared_ptr<ContentExtractorFactory> extractor_factory;
    std::shared_ptr<IngestionService> ingestion_service;
    std::shared_ptr<SearchService> search_service;
  };

  explicit ServiceProvider(Services services) : services_(std::move(services)) {}

  DatabaseManager& get_database_manager() {
    return *services_.database_manager;
  }
  OllamaClient& get_ollama_client() {
    return *services_.ollama_client;
  }
  async::ConcurrencyLimiter& get_embedding_limiter() {
    return *services_.embedding_limiter;
  }
  EmbeddingGenerator& get_embedding_generator() {
    return *services_.embedding_generator;
  }
  DocumentStore& get_document_store() {
    return *services_.document_store;
  }
  RetrievalEngine& get_retrieval_engine() {
    return *services_.retrieval_engine;
  }
  ContentExtractorFactory& get_extractor_factory() {
    return *services_.extractor_factory;
  }
  IngestionService& get_ingestion_service() {
    return *services_.ingestion_service;
  }
  SearchService& get_search_service() {
    return *services_.search_service;
  }

 private:
  Services services_;
};

}  // namespace ragkit_core
