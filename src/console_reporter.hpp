#pragma once

#include "rate_limiter.hpp"
#include "split_reporter.hpp"

#include <chrono>
#include <cstddef>
#include <iosfwd>
#include <string>

namespace nsp_split {

// Renders split progress as text lines plus a carriage-return progress bar.
class ConsoleReporter final : public SplitReporter {
public:
    static constexpr std::chrono::milliseconds kConsoleProgressInterval{50};

    explicit ConsoleReporter(
        std::ostream& out,
        SteadyClock::duration progress_interval = kConsoleProgressInterval,
        TimeSource now = steady_time_source()
    );

    void report_initial_info(std::uint64_t total_parts, std::uint64_t total_bytes) override;
    void report_start_part(std::uint64_t part_number, std::uint64_t total_parts) override;
    void report_finish_part(std::uint64_t part_number, std::uint64_t total_parts) override;
    void report_file_progress(std::uint64_t written_bytes, std::uint64_t total_bytes) override;
    void report_archive_bit(const std::optional<std::string>& error_message) override;

private:
    void print_line(const std::string& msg, bool newline = true);

    std::ostream& out_;
    RateLimiter progress_limiter_;
    std::size_t last_line_length_ = 0;
};

// 1234567 -> "1,234,567"
std::string format_grouped(std::uint64_t value);

}  // namespace nsp_split
