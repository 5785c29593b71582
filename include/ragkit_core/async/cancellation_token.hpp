#pragma once

#include <atomic>
#include <memory>
#include <string>

namespace ragkit_core::async {

class CancelledError : public std::exception {
 public:
  explicit CancelledError(const std::string& message) : message_(message) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

/**
 * @class CancellationToken
 * @brief Shared cooperative cancellation flag.
 *
 * Copies share the same flag, so a token handed to a worker can be cancelled
 * from the thread that owns the batch. Long-running operations call
 * throw_if_cancelled() at their checkpoints.
 */
class CancellationToken {
 public:
  CancellationToken() : cancelled_(std::make_shared<std::atomic<bool>>(false)) {}

  void cancel() const {
    cancelled_->store(true);
  }

  bool is_cancelled() const {
    return cancelled_->load();
  }

  void throw_if_cancelled(const std::string& checkpoint) const {
    if (is_cancelled()) {
      throw CancelledError("Cancelled at " + checkpoint);
    }
  }

 private:
  std::shared_ptr<std::atomic<bool>> cancelled_;
};

}  // namespace ragkit_core::async
