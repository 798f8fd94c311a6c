#pragma once

#include "event_queue.hpp"
#include "rate_limiter.hpp"
#include "split_reporter.hpp"

#include <chrono>

namespace nsp_split {

// Turns reporter calls into events on an EventQueue. FileProgress is thinned
// to one event per kQueueProgressInterval; everything else is always queued.
class QueueReporter final : public SplitReporter {
public:
    static constexpr std::chrono::milliseconds kQueueProgressInterval{130};

    explicit QueueReporter(EventQueue& queue, TimeSource now = steady_time_source());

    void report_initial_info(std::uint64_t total_parts, std::uint64_t total_bytes) override;
    void report_start_part(std::uint64_t part_number, std::uint64_t total_parts) override;
    void report_finish_part(std::uint64_t part_number, std::uint64_t total_parts) override;
    void report_file_progress(std::uint64_t written_bytes, std::uint64_t total_bytes) override;
    void report_archive_bit(const std::optional<std::string>& error_message) override;

private:
    EventQueue& queue_;
    RateLimiter progress_limiter_;
};

}  // namespace nsp_split
