#pragma once
#include "xarb/common.hpp"
#include "xarb/errors.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>
#include <thread>

namespace xarb {

// Run `fn`, retrying TransientVenueError with exponential backoff.
// RateLimited waits the venue's hint and does not consume an attempt, but
// draws from its own budget. Anything else propagates immediately.
template <typename Fn>
auto withRetry(Fn &&fn, const RetryPolicy &policy, const std::string &label)
    -> decltype(fn()) {
  int attempt = 0;
  int waits = 0;
  int delay = policy.base_delay_ms;

  while (true) {
    try {
      return fn();
    } catch (const RateLimited &e) {
      if (++waits > policy.max_rate_limit_waits)
        throw;
      auto hint = std::max<long long>(e.retryAfter().count(), delay);
      spdlog::warn("[Retry] {} rate limited, waiting {}ms", label, hint);
      std::this_thread::sleep_for(std::chrono::milliseconds(hint));
    } catch (const TransientVenueError &e) {
      if (++attempt >= policy.max_attempts)
        throw;
      spdlog::warn("[Retry] {} failed ({}), attempt {}/{} in {}ms", label,
                   e.what(), attempt, policy.max_attempts, delay);
      std::this_thread::sleep_for(std::chrono::milliseconds(delay));
      delay = std::min(delay * 2, policy.max_delay_ms);
    }
  }
}

} // namespace xarb
