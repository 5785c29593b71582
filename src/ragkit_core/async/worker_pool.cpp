#include "ragkit_core/async/worker_pool.hpp"

#include <algorithm>
#include <iostream>
#include <memory>
#include <stdexcept>

namespace ragkit_core::async {

WorkerPool::WorkerPool(size_t num_threads, ServiceProvider& services)
    : num_threads_(num_threads), services_(services) {
  if (num_threads == 0) {
    throw std::invalid_argument("WorkerPool must have at least one thread.");
  }
  std::cout << "WorkerPool created with " << num_threads << " workers." << std::endl;
}

WorkerPool::~WorkerPool() {
  std::cout << "WorkerPool shutting down." << std::endl;
}

std::vector<IngestionResult> WorkerPool::ingest_all(
    const std::vector<std::filesystem::path>& paths,
    const std::filesystem::path& documents_root,
    const CancellationToken& token,
    ProgressCallback progress_callback) {
  std::lock_guard<std::mutex> run_lock(run_mutex_);

  std::vector<IngestionResult> results(paths.size());
  if (paths.empty()) {
    return results;
  }

  JobQueue queue;
  for (size_t i = 0; i < paths.size(); ++i) {
    queue.push(IngestionJob{i, paths[i]});
  }

  std::mutex results_mutex;
  size_t completed = 0;
  auto on_result = [&](size_t position, IngestionResult result) {
    std::lock_guard<std::mutex> lock(results_mutex);
    results[position] = std::move(result);
    ++completed;
    if (progress_callback) {
      progress_callback(completed, paths.size());
    }
  };

  const size_t worker_count = std::min(num_threads_, paths.size());
  std::cout << "WorkerPool: ingesting " << paths.size() << " documents on " << worker_count
            << " workers" << std::endl;
  {
    std::vector<std::unique_ptr<Worker>> workers;
    workers.reserve(worker_count);
    for (size_t i = 0; i < worker_count; ++i) {
      workers.emplace_back(std::make_unique<Worker>(static_cast<int>(i), services_, queue,
                                                    documents_root, token, on_result));
    }
    for (const auto& worker : workers) {
      worker->start();
    }
    for (const auto& worker : workers) {
      worker->join();
    }
  }

  size_t failed = 0;
  int chunks = 0;
  for (const auto& result : results) {
    if (result.status == IngestionStatus::Failed) {
      ++failed;
    }
    chunks += result.chunks_created;
  }
  std::cout << "WorkerPool: ingestion complete: " << results.size() << " documents, " << chunks
            << " chunks, " << failed << " failed" << std::endl;
  return results;
}

}  // namespace ragkit_core::async
