#pragma once

#include <atomic>
#include <cstddef>
#include <deque>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>

#include "ragkit_core/async/cancellation_token.hpp"
#include "ragkit_core/services/ingestion_service.hpp"

namespace ragkit_core {
class ServiceProvider;
}

namespace ragkit_core {
namespace async {

struct IngestionJob {
  size_t position = 0;
  std::filesystem::path file_path;
};

// Shared FIFO the workers of one run pull documents from.
class JobQueue {
 public:
  void push(IngestionJob job);
  std::optional<IngestionJob> try_pop();
  size_t size() const;

 private:
  mutable std::mutex mutex_;
  std::deque<IngestionJob> jobs_;
};

/**
 * @class Worker
 * @brief A single background thread that ingests documents from a JobQueue.
 *
 * The worker pulls jobs until the queue is empty or stop() is called. Each
 * document runs in its own try block: a failure is handed to the result
 * handler as a Failed result and the loop moves on. Once the token is
 * cancelled, remaining jobs are reported as Failed without being started.
 *
 * Non-copyable and non-movable so the thread has a single clear owner.
 */
class Worker {
 public:
  using ResultHandler = std::function<void(size_t position, IngestionResult result)>;

  /**
   * @param worker_id Identifier used in log lines.
   * @param services Provides the IngestionService.
   * @param queue Queue shared by all workers of the run.
   * @param documents_root Root used to compute each document's source.
   * @param token Cancellation token of the run.
   * @param on_result Called once per job, from the worker thread.
   */
  Worker(int worker_id,
         ServiceProvider& services,
         JobQueue& queue,
         std::filesystem::path documents_root,
         CancellationToken token,
         ResultHandler on_result);

  // Stops and joins the thread.
  ~Worker();

  // Throws std::runtime_error if the worker is already running.
  void start();

  // Does not block; the worker exits after its current document.
  void stop();

  void join();

  // Processes one job synchronously. Returns false when the queue was empty.
  bool run_one_job();

  Worker(const Worker&) = delete;
  Worker& operator=(const Worker&) = delete;
  Worker(Worker&&) = delete;
  Worker& operator=(Worker&&) = delete;

 private:
  void run_loop();
  IngestionResult process(const IngestionJob& job);

  int worker_id_;
  ServiceProvider& services_;
  JobQueue& queue_;
  std::filesystem::path documents_root_;
  CancellationToken token_;
  ResultHandler on_result_;
  std::atomic<bool> should_stop_{false};
  std::thread thread_;
};

}  // namespace async
}  // namespace ragkit_core
