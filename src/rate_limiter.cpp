#include "rate_limiter.hpp"

#include <utility>

namespace nsp_split {

TimeSource steady_time_source() {
    return [] { return SteadyClock::now(); };
}

RateLimiter::RateLimiter(SteadyClock::duration interval, TimeSource now)
    : interval_(interval), now_(std::move(now)), last_(now_()) {}

bool RateLimiter::allow() {
    const auto current = now_();
    if (current - last_ < interval_) {
        return false;
    }
    last_ = current;
    return true;
}

}  // namespace nsp_split
