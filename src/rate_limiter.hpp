#pragma once

#include <chrono>
#include <functional>

namespace nsp_split {

using SteadyClock = std::chrono::steady_clock;
using TimeSource = std::function<SteadyClock::time_point()>;

TimeSource steady_time_source();

// Lets a call through only when `interval` has passed since the last call it
// let through. The reference point starts at construction.
class RateLimiter {
public:
    explicit RateLimiter(SteadyClock::duration interval, TimeSource now = steady_time_source());

    bool allow();

private:
    SteadyClock::duration interval_;
    TimeSource now_;
    SteadyClock::time_point last_;
};

}  // namespace nsp_split
