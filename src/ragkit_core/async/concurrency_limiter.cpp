#include "ragkit_core/async/concurrency_limiter.hpp"

#include <stdexcept>

namespace ragkit_core::async {

ConcurrencyLimiter::ConcurrencyLimiter(size_t max_concurrent) : max_concurrent_(max_concurrent) {
  if (max_concurrent_ == 0) {
    throw std::invalid_argument("ConcurrencyLimiter needs at least one slot.");
  }
}

ConcurrencyLimiter::Permit ConcurrencyLimiter::acquire(const CancellationToken& token) {
  std::unique_lock<std::mutex> lock(mtx_);
  while (in_flight_ >= max_concurrent_) {
    token.throw_if_cancelled("embedding slot wait");
    cv_.wait_for(lock, kCancelPollInterval);
  }
  token.throw_if_cancelled("embedding slot wait");
  ++in_flight_;
  return Permit(*this);
}

size_t ConcurrencyLimiter::in_flight() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return in_flight_;
}

void ConcurrencyLimiter::release() {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    --in_flight_;
  }
  cv_.notify_one();
}

}  // namespace ragkit_core::async
