#pragma once

#include <filesystem>
#include <functional>
#include <mutex>
#include <vector>

#include "ragkit_core/async/cancellation_token.hpp"
#include "ragkit_core/async/worker.hpp"
#include "ragkit_core/services/ingestion_service.hpp"

namespace ragkit_core {
class ServiceProvider;
}

namespace ragkit_core::async {

/**
 * @class WorkerPool
 * @brief Ingests a batch of documents on a fixed number of worker threads.
 *
 * Every call to ingest_all() fills a fresh queue, starts the workers and
 * blocks until all of them have joined. Documents run in parallel; the steps
 * of one document stay on one worker. Embedding calls are throttled by the
 * limiter shared through the EmbeddingGenerator, not by the pool.
 */
class WorkerPool {
 public:
  // Called after each document with (completed, total).
  using ProgressCallback = std::function<void(size_t, size_t)>;

  /**
   * @param num_threads Number of workers per run; must be at least 1.
   * @param services Provides the IngestionService to the workers.
   */
  WorkerPool(size_t num_threads, ServiceProvider& services);

  ~WorkerPool();

  /**
   * @brief Ingests every path and returns one result per path, in input order.
   *
   * A failing document becomes a Failed result and the run continues. After
   * the token is cancelled no new document starts and the remaining ones are
   * reported as Failed.
   */
  std::vector<IngestionResult> ingest_all(const std::vector<std::filesystem::path>& paths,
                                          const std::filesystem::path& documents_root = {},
                                          const CancellationToken& token = {},
                                          ProgressCallback progress_callback = {});

  size_t num_threads() const {
    return num_threads_;
  }

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;
  WorkerPool(WorkerPool&&) = delete;
  WorkerPool& operator=(WorkerPool&&) = delete;

 private:
  size_t num_threads_;
  ServiceProvider& services_;
  // One run at a time.
  std::mutex run_mutex_;
};

}  // namespace ragkit_core::async
