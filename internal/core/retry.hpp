#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <thread>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace loyalty::core {

struct RetryPolicy {
  std::uint32_t             max_attempts = 5;
  std::chrono::milliseconds backoff{2};
};

/*
  Runs `fn` (a complete read-compute-write unit that opens its own
  transaction) until it finishes without util::VersionConflict.

  Backoff grows linearly with the attempt number. When the attempt budget is
  spent the conflict surfaces as util::TransientFailure. Every other exception
  propagates on the first attempt.
*/
template <typename Fn>
auto RunWithRetry(const RetryPolicy& policy, std::string_view operation, Fn&& fn) -> decltype(fn()) {
  const std::uint32_t max_attempts = policy.max_attempts == 0 ? 1 : policy.max_attempts;

  for (std::uint32_t attempt = 1;; ++attempt) {
    try {
      return fn();
    } catch (const util::VersionConflict& e) {
      if (attempt >= max_attempts) {
        LOYALTY_LOG_WARN("retry budget exhausted",
                         {observability::StringField("operation", operation), observability::IntField("attempts", attempt),
                          observability::StringField("error", e.what())});
        throw util::TransientFailure(std::string(operation) + ": concurrent modification, try again");
      }
      LOYALTY_LOG_DEBUG("version conflict, retrying",
                        {observability::StringField("operation", operation), observability::IntField("attempt", attempt)});
    }
    std::this_thread::sleep_for(policy.backoff * attempt);
  }
}

} // namespace loyalty::core
