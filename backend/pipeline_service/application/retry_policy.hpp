#pragma once

#include "common/config/config.hpp"

#include <algorithm>
#include <chrono>

namespace pipeline_service {

// Capped exponential backoff: base * 2^(attempt-1), never above max_delay.
class RetryPolicy {
public:
  explicit RetryPolicy(const config::RetryConfig& cfg)
    : max_attempts_(std::max(1, cfg.max_attempts)),
      base_delay_(cfg.base_delay),
      max_delay_(cfg.max_delay) {}

  int maxAttempts() const { return max_attempts_; }

  bool shouldRetry(int attempt) const { return attempt < max_attempts_; }

  // Wait before the attempt following `attempt` (1-based).
  std::chrono::milliseconds delayAfter(int attempt) const {
    auto delay = base_delay_;
    for (int i = 1; i < attempt && delay < max_delay_; ++i) {
      delay *= 2;
    }
    return std::min(delay, max_delay_);
  }

private:
  int max_attempts_;
  std::chrono::milliseconds base_delay_;
  std::chrono::milliseconds max_delay_;
};

} // namespace pipeline_service
