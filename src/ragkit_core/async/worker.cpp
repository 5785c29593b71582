#include "ragkit_core/async/worker.hpp"

#include <iostream>
#include <stdexcept>

#include "ragkit_core/async/service_provider.hpp"

namespace ragkit_core {
namespace async {

void JobQueue::push(IngestionJob job) {
  std::lock_guard<std::mutex> lock(mutex_);
  jobs_.push_back(std::move(job));
}

std::optional<IngestionJob> JobQueue::try_pop() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (jobs_.empty()) {
    return std::nullopt;
  }
  IngestionJob job = std::move(jobs_.front());
  jobs_.pop_front();
  return job;
}

size_t JobQueue::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return jobs_.size();
}

Worker::Worker(int worker_id,
               ServiceProvider& services,
               JobQueue& queue,
               std::filesystem::path documents_root,
               CancellationToken token,
               ResultHandler on_result)
    : worker_id_(worker_id),
      services_(services),
      queue_(queue),
      documents_root_(std::move(documents_root)),
      token_(std::move(token)),
      on_result_(std::move(on_result)) {
  std::cout << "Worker [" << worker_id_ << "] created." << std::endl;
}

Worker::~Worker() {
  stop();
  join();
  std::cout << "Worker [" << worker_id_ << "] joined and shut down." << std::endl;
}

void Worker::start() {
  if (thread_.joinable()) {
    throw std::runtime_error("Worker is already running.");
  }
  should_stop_.store(false);
  thread_ = std::thread(&Worker::run_loop, this);
}

void Worker::stop() {
  should_stop_.store(true);
}

void Worker::join() {
  if (thread_.joinable()) {
    thread_.join();
  }
}

void Worker::run_loop() {
  std::cout << "Worker [" << worker_id_ << "] starting run loop." << std::endl;
  while (!should_stop_.load()) {
    if (!run_one_job()) {
      break;
    }
  }
  std::cout << "Worker [" << worker_id_ << "] run loop terminated." << std::endl;
}

bool Worker::run_one_job() {
  std::optional<IngestionJob> job = queue_.try_pop();
  if (!job) {
    return false;
  }
  IngestionResult result = process(*job);
  if (on_result_) {
    on_result_(job->position, std::move(result));
  }
  return true;
}

IngestionResult Worker::process(const IngestionJob& job) {
  IngestionResult failed;
  failed.status = IngestionStatus::Failed;
  failed.title = job.file_path.filename().string();
  failed.source = job.file_path.string();

  if (token_.is_cancelled()) {
    failed.errors.push_back("Cancelled before processing started");
    return failed;
  }

  std::cout << "Worker [" << worker_id_ << "] processing " << job.file_path << std::endl;
  try {
    return services_.get_ingestion_service().ingest_document(job.file_path, documents_root_,
                                                             token_);
  } catch (const CancelledError& e) {
    std::cerr << "Worker [" << worker_id_ << "] cancelled while processing " << job.file_path
              << ": " << e.what() << std::endl;
    failed.errors.push_back(e.what());
  } catch (const std::exception& e) {
    std::cerr << "Worker [" << worker_id_ << "] ERROR processing " << job.file_path << ": "
              << e.what() << std::endl;
    failed.errors.push_back(e.what());
  }
  return failed;
}

}  // namespace async
}  // namespace ragkit_core
