#pragma once

#include <algorithm>
#include <chrono>
#include <iostream>
#include <string>
#include <thread>

namespace docrag_core {

// Bounded exponential backoff. Attempt n (1-based) that fails waits
// min(initial_delay * multiplier^(n-1), max_delay) before attempt n + 1.
struct RetryPolicy {
  int max_attempts = 3;
  std::chrono::milliseconds initial_delay{250};
  double multiplier = 2.0;
  std::chrono::milliseconds max_delay{4000};

  static RetryPolicy no_retry() {
    RetryPolicy policy;
    policy.max_attempts = 1;
    return policy;
  }

  std::chrono::milliseconds delay_after(int failed_attempt) const {
    double delay = static_cast<double>(initial_delay.count());
    for (int i = 1; i < failed_attempt; ++i) {
      delay *= multiplier;
    }
    const double capped = std::min(delay, static_cast<double>(max_delay.count()));
    return std::chrono::milliseconds(static_cast<long long>(capped));
  }
};

/**
 * @brief Runs `fn` until it succeeds or the policy's attempt cap is reached.
 *
 * Only exceptions of type `Retryable` (or derived from it) are retried;
 * anything else propagates immediately. The last `Retryable` is rethrown
 * once attempts are exhausted.
 */
template <typename Retryable, typename Fn>
auto with_retry(const RetryPolicy& policy, const std::string& label, Fn&& fn) -> decltype(fn()) {
  const int attempts = std::max(1, policy.max_attempts);
  for (int attempt = 1;; ++attempt) {
    try {
      return fn();
    } catch (const Retryable& e) {
      if (attempt >= attempts) {
        std::cerr << "[Retry] " << label << " failed after " << attempt
                  << " attempt(s): " << e.what() << std::endl;
        throw;
      }
      const auto delay = policy.delay_after(attempt);
      std::cerr << "[Retry] " << label << " attempt " << attempt << " failed: " << e.what()
                << ". Retrying in " << delay.count() << "ms" << std::endl;
      if (delay.count() > 0) {
        std::this_thread::sleep_for(delay);
      }
    }
  }
}

}  // namespace docrag_core
