#include "retry.hpp"

#include <algorithm>

namespace weave::async {

namespace {
// 2^30 times any sane base delay already exceeds every practical cap.
constexpr std::size_t K_MAX_BACKOFF_SHIFT = 30;
// Every delay saturates here so deadlines computed from it stay
// representable in nanoseconds.
constexpr std::chrono::milliseconds K_MAX_RETRY_DELAY =
    std::chrono::hours(24 * 365);
}  // namespace

auto RetryOptions::delayFor(std::size_t attempt) const
    -> std::chrono::milliseconds {
    auto delay = retryDelay;
    if (backoff) {
        using Rep = std::chrono::milliseconds::rep;
        auto shift = std::min(attempt, K_MAX_BACKOFF_SHIFT);
        if (retryDelay.count() > (K_MAX_RETRY_DELAY.count() >> shift)) {
            delay = K_MAX_RETRY_DELAY;
        } else {
            delay = retryDelay * (Rep{1} << shift);
        }
    }
    delay = std::min(delay, K_MAX_RETRY_DELAY);
    if (maxDelay && delay > *maxDelay) {
        delay = *maxDelay;
    }
    return delay;
}

void RetryOptions::validate() const {
    if (retryDelay < std::chrono::milliseconds::zero()) {
        THROW_INVALID_ARGUMENT("retryDelay must not be negative");
    }
    if (maxDelay && *maxDelay < std::chrono::milliseconds::zero()) {
        THROW_INVALID_ARGUMENT("maxDelay must not be negative");
    }
}

}  // namespace weave::async
