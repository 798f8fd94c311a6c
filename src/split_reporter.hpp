#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace nsp_split {

// Hooks called synchronously by split_file() on the splitting thread.
// Every hook defaults to doing nothing; a reporter must not throw back into
// the engine.
class SplitReporter {
public:
    virtual ~SplitReporter() = default;

    virtual void report_initial_info(std::uint64_t /*total_parts*/, std::uint64_t /*total_bytes*/) {}
    virtual void report_start_part(std::uint64_t /*part_number*/, std::uint64_t /*total_parts*/) {}
    virtual void report_finish_part(std::uint64_t /*part_number*/, std::uint64_t /*total_parts*/) {}
    virtual void report_file_progress(std::uint64_t /*written_bytes*/, std::uint64_t /*total_bytes*/) {}

    // error_message is absent on success.
    virtual void report_archive_bit(const std::optional<std::string>& /*error_message*/) {}
};

}  // namespace nsp_split
