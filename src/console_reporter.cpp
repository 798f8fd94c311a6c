#include "console_reporter.hpp"

#include <algorithm>
#include <iomanip>
#include <ostream>
#include <sstream>
#include <utility>

namespace nsp_split {
namespace {

constexpr std::size_t kBarWidth = 30;

std::string two_digit(std::uint64_t value) {
    std::ostringstream ss;
    ss << std::setw(2) << std::setfill('0') << value;
    return ss.str();
}

}  // namespace

std::string format_grouped(std::uint64_t value) {
    std::string digits = std::to_string(value);
    std::string out;
    out.reserve(digits.size() + digits.size() / 3);
    for (std::size_t i = 0; i < digits.size(); ++i) {
        if (i != 0 && (digits.size() - i) % 3 == 0) {
            out.push_back(',');
        }
        out.push_back(digits[i]);
    }
    return out;
}

ConsoleReporter::ConsoleReporter(std::ostream& out, SteadyClock::duration progress_interval, TimeSource now)
    : out_(out), progress_limiter_(progress_interval, std::move(now)) {}

void ConsoleReporter::print_line(const std::string& msg, bool newline) {
    // Pad over whatever the last progress line left behind.
    out_ << std::left << std::setw(static_cast<int>(last_line_length_)) << msg << std::right;
    if (newline) {
        out_ << "\n";
        last_line_length_ = 0;
    } else {
        out_ << "\r";
        last_line_length_ = msg.size();
    }
    out_.flush();
}

void ConsoleReporter::report_initial_info(std::uint64_t total_parts, std::uint64_t total_bytes) {
    print_line(
        "Splitting NSP of size " + format_grouped(total_bytes) + " bytes into " +
        std::to_string(total_parts) + " parts..."
    );
}

void ConsoleReporter::report_start_part(std::uint64_t part_number, std::uint64_t total_parts) {
    print_line("Starting part " + two_digit(part_number + 1) + " of " + two_digit(total_parts));
}

void ConsoleReporter::report_finish_part(std::uint64_t part_number, std::uint64_t total_parts) {
    print_line("Part " + two_digit(part_number + 1) + " of " + two_digit(total_parts) + " complete");
}

void ConsoleReporter::report_file_progress(std::uint64_t written_bytes, std::uint64_t total_bytes) {
    if (!progress_limiter_.allow()) {
        return;
    }

    const double ratio = total_bytes > 0
        ? static_cast<double>(written_bytes) / static_cast<double>(total_bytes)
        : 0.0;
    const auto pct = static_cast<int>(std::clamp(ratio, 0.0, 1.0) * 100.0);
    const std::string total = format_grouped(total_bytes);

    // [=====>-----] with the arrow marking the current position.
    const std::size_t filled = static_cast<std::size_t>(pct) * kBarWidth / 100;
    std::string bar(filled, '=');
    if (filled < kBarWidth) {
        bar.push_back('>');
        bar.append(kBarWidth - filled - 1, '-');
    }

    std::ostringstream line;
    line
        << "[" << bar << "] "
        << std::setw(3) << pct << "% "
        << std::setw(static_cast<int>(total.size())) << format_grouped(written_bytes)
        << " / " << total << " bytes";

    print_line(line.str(), false);
}

void ConsoleReporter::report_archive_bit(const std::optional<std::string>& error_message) {
    if (!error_message || error_message->empty()) {
        print_line("Successfully set archive bit");
    } else {
        print_line("Could not set archive bit (" + *error_message + ")");
    }
}

}  // namespace nsp_split
