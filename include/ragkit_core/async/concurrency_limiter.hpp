#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>

#include "ragkit_core/async/cancellation_token.hpp"

namespace ragkit_core::async {

/**
 * @class ConcurrencyLimiter
 * @brief Counting semaphore capping how many embedding calls run at once.
 *
 * Shared by every worker of an ingestion run and by the query path. A permit
 * is held for the duration of one backend call.
 */
class ConcurrencyLimiter {
 public:
  class Permit {
   public:
    explicit Permit(ConcurrencyLimiter& limiter) : limiter_(&limiter) {}
    ~Permit() {
      if (limiter_) {
        limiter_->release();
      }
    }
    Permit(Permit&& other) noexcept : limiter_(other.limiter_) {
      other.limiter_ = nullptr;
    }
    Permit(const Permit&) = delete;
    Permit& operator=(const Permit&) = delete;
    Permit& operator=(Permit&&) = delete;

   private:
    ConcurrencyLimiter* limiter_;
  };

  explicit ConcurrencyLimiter(size_t max_concurrent);

  // Blocks until a slot is free. Throws CancelledError if the token fires
  // while waiting.
  Permit acquire(const CancellationToken& token = {});

  size_t max_concurrent() const {
    return max_concurrent_;
  }
  size_t in_flight() const;

  ConcurrencyLimiter(const ConcurrencyLimiter&) = delete;
  ConcurrencyLimiter& operator=(const ConcurrencyLimiter&) = delete;

 private:
  void release();

  static constexpr std::chrono::milliseconds kCancelPollInterval{50};

  size_t max_concurrent_;
  size_t in_flight_ = 0;
  mutable std::mutex mtx_;
  std::condition_variable cv_;
};

}  // namespace ragkit_core::async
