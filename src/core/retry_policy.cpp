#include "core/retry_policy.h"

#include <cmath>
#include <utility>

namespace trade_pilot {

RetryPolicy::RetryPolicy(int max_attempts, BackoffFn backoff_ms, const Sleeper* sleeper)
    : max_attempts_(max_attempts < 1 ? 1 : max_attempts),
      backoff_ms_(std::move(backoff_ms)),
      sleeper_(sleeper) {}

std::int64_t RetryPolicy::ModelBackoffMs(int attempt) {
  const double seconds = std::pow(2.0, attempt) + 0.1 * attempt;
  return static_cast<std::int64_t>(std::llround(seconds * 1000.0));
}

std::int64_t RetryPolicy::ExchangeReadBackoffMs(int attempt) {
  return 200LL << (attempt < 0 ? 0 : (attempt > 6 ? 6 : attempt));
}

RetryPolicy RetryPolicy::NoRetry() {
  return RetryPolicy(1, nullptr, nullptr);
}

std::int64_t RetryPolicy::BackoffMs(int attempt) const {
  if (!backoff_ms_) {
    return 0;
  }
  const std::int64_t wait = backoff_ms_(attempt);
  return wait < 0 ? 0 : wait;
}

}  // namespace trade_pilot
