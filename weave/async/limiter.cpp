#include "limiter.hpp"

#include <thread>

#include <spdlog/spdlog.h>

#include "weave/error/exception.hpp"

namespace weave::async {

namespace {
auto intervalFor(double rate_limit) -> std::chrono::nanoseconds {
    if (rate_limit < 0.0) {
        THROW_INVALID_ARGUMENT("rateLimit must not be negative, got {}",
                               rate_limit);
    }
    if (rate_limit == 0.0) {
        return std::chrono::nanoseconds::zero();
    }
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::duration<double>(1.0 / rate_limit));
}
}  // namespace

IntervalGate::IntervalGate(double rate_limit)
    : interval_(intervalFor(rate_limit)) {
    spdlog::debug("IntervalGate created with interval {} ns",
                  interval_.count());
}

void IntervalGate::acquire() {
    std::lock_guard lock(mutex_);
    if (last_start_) {
        auto next_start = *last_start_ + interval_;
        auto now = Clock::now();
        if (now < next_start) {
            auto wait = next_start - now;
            spdlog::debug("Rate limit reached, delaying start by {} ns",
                          std::chrono::duration_cast<std::chrono::nanoseconds>(
                              wait)
                              .count());
            std::this_thread::sleep_until(next_start);
        }
    }
    last_start_ = Clock::now();
}

}  // namespace weave::async
