#include <atomic>
#include <condition_variable>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <mutex>

#include "ragkit_api/config.hpp"
#include "ragkit_api/routes.hpp"
#include "ragkit_api/server.hpp"
#include "ragkit_core/async/cancellation_token.hpp"
#include "ragkit_core/async/concurrency_limiter.hpp"
#include "ragkit_core/async/service_provider.hpp"
#include "ragkit_core/async/worker_pool.hpp"
#include "ragkit_core/chunking/chunk_splitter.hpp"
#include "ragkit_core/db/database_manager.hpp"
#include "ragkit_core/db/document_store.hpp"
#include "ragkit_core/embedding/embedding_generator.hpp"
#include "ragkit_core/extractors/content_extractor_factory.hpp"
#include "ragkit_core/llm/ollama_client.hpp"
#include "ragkit_core/retrieval/retrieval_engine.hpp"
#include "ragkit_core/services/ingestion_service.hpp"
#include "ragkit_core/services/search_service.hpp"

std::atomic<bool> shutdown_requested = false;
std::mutex shutdown_mutex;
std::condition_variable shutdown_cv;
// Checked by running ingestions between documents and chunks.
ragkit_core::async::CancellationToken shutdown_token;

void signal_handler(int signal) {
  std::cout << "\nShutdown signal (" << signal << ") received. Initiating graceful shutdown..."
            << std::endl;
  shutdown_token.cancel();
  shutdown_requested = true;
  shutdown_cv.notify_one();
}

namespace {

std::string database_key_from_env() {
  const char* key = std::getenv("RAGKIT_DB_KEY");
  if (key == nullptr || std::string(key).empty()) {
    throw ragkit_api::ConfigError("RAGKIT_DB_KEY must be set to the database key");
  }
  return key;
}

}  // namespace

int main() {
  try {
    ragkit_api::Config config = ragkit_api::Config::from_file("ragkitrc.json");
    std::string db_key = database_key_from_env();

    std::cout << "Starting ragkit API Server..." << std::endl;
    std::cout << "Server URL: " << config.api_base_url << std::endl;
    std::cout << "Metadata DB Path: " << config.metadata_db_path << std::endl;
    std::cout << "Ollama URL: " << config.ollama_url << std::endl;
    std::cout << "Embedding Model: " << config.embedding_model << " ("
              << config.embedding_dimension << " dims)" << std::endl;
    std::cout << "Chunking: " << config.chunk_size << "/" << config.chunk_overlap
              << (config.use_semantic_chunking ? " semantic" : " structural") << std::endl;

    // Initialize core components
    auto ollama_client =
        std::make_shared<ragkit_core::OllamaClient>(config.ollama_url, config.embedding_model);
    if (!ollama_client->is_server_available()) {
      std::cerr << "Warning: Ollama is not reachable at " << config.ollama_url
                << "; embedding calls will fail until it is." << std::endl;
    }

    std::filesystem::path db_path(config.metadata_db_path);
    if (db_path.has_parent_path()) {
      std::filesystem::create_directories(db_path.parent_path());
    }
    auto db_manager = std::make_shared<ragkit_core::DatabaseManager>();
    db_manager->initialize(db_path, db_key, config.pool_size,
                           std::chrono::milliseconds(config.pool_acquire_timeout_ms));

    auto limiter = std::make_shared<ragkit_core::async::ConcurrencyLimiter>(
        static_cast<size_t>(config.embedding_concurrency));
    auto embedding_generator = std::make_shared<ragkit_core::EmbeddingGenerator>(
        ollama_client, config.embedding_options(), limiter);
    auto document_store = std::make_shared<ragkit_core::DocumentStore>(
        *db_manager, static_cast<size_t>(config.embedding_dimension));
    auto retrieval_engine = std::make_shared<ragkit_core::RetrievalEngine>(document_store);
    auto extractor_factory = std::make_shared<ragkit_core::ContentExtractorFactory>();
    auto splitter = std::make_shared<ragkit_core::ChunkSplitter>(config.chunking_config(),
                                                                 embedding_generator);
    auto ingestion_service = std::make_shared<ragkit_core::IngestionService>(
        extractor_factory, splitter, embedding_generator, document_store);
    auto search_service = std::make_shared<ragkit_core::SearchService>(
        embedding_generator, retrieval_engine, document_store);

    ragkit_core::ServiceProvider services({db_manager, ollama_client, limiter, embedding_generator,
                                           document_store, retrieval_engine, extractor_factory,
                                           ingestion_service, search_service});
    auto worker_pool = std::make_shared<ragkit_core::async::WorkerPool>(
        static_cast<size_t>(config.num_workers), services);

    ragkit_api::Server server(config.host(), config.port());
    ragkit_api::Routes routes(search_service, ingestion_service, worker_pool,
                              static_cast<float>(config.default_text_weight), shutdown_token);
    routes.register_routes(server);

    std::cout << "Disabling Crow's internal signal handling..." << std::endl;
    server.get_app().signal_clear();

    server.start();
    std::cout << "Server started successfully. Press Ctrl+C to exit." << std::endl;

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    {
      std::unique_lock<std::mutex> lock(shutdown_mutex);
      shutdown_cv.wait(lock, [] { return shutdown_requested.load(); });
    }

    std::cout << "[1/3] Stopping API server to refuse new requests..." << std::endl;
    server.stop();

    std::cout << "[2/3] Waiting for in-flight ingestion to stop..." << std::endl;
    routes.shutdown();

    std::cout << "[3/3] Shutting down database connections..." << std::endl;
    db_manager->shutdown();

    std::cout << "Shutdown complete." << std::endl;
  } catch (const std::exception& e) {
    std::cerr << "Error starting server: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
