#include "model/rate_limiter.h"

namespace trade_pilot {

SlidingWindowRateLimiter::SlidingWindowRateLimiter(int max_requests,
                                                   std::int64_t window_ms,
                                                   const Clock* clock)
    : max_requests_(max_requests),
      window_ms_(window_ms),
      clock_(clock != nullptr ? clock : &DefaultClock()) {}

void SlidingWindowRateLimiter::EvictExpired(std::deque<std::int64_t>* stamps,
                                            std::int64_t now_ms) const {
  while (!stamps->empty() && now_ms - stamps->front() >= window_ms_) {
    stamps->pop_front();
  }
}

bool SlidingWindowRateLimiter::TryAcquire(const std::string& key) {
  const std::int64_t now_ms = clock_->NowMs();
  std::lock_guard<std::mutex> lock(mutex_);
  auto& stamps = requests_[key];
  EvictExpired(&stamps, now_ms);
  if (static_cast<int>(stamps.size()) >= max_requests_) {
    return false;
  }
  stamps.push_back(now_ms);
  return true;
}

int SlidingWindowRateLimiter::Count(const std::string& key) {
  const std::int64_t now_ms = clock_->NowMs();
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = requests_.find(key);
  if (it == requests_.end()) {
    return 0;
  }
  EvictExpired(&it->second, now_ms);
  return static_cast<int>(it->second.size());
}

}  // namespace trade_pilot
