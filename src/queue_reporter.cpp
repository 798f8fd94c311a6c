#include "queue_reporter.hpp"

#include <utility>

namespace nsp_split {

QueueReporter::QueueReporter(EventQueue& queue, TimeSource now)
    : queue_(queue), progress_limiter_(kQueueProgressInterval, std::move(now)) {}

void QueueReporter::report_initial_info(std::uint64_t total_parts, std::uint64_t total_bytes) {
    queue_.push(InitialInfoEvent{total_parts, total_bytes});
}

void QueueReporter::report_start_part(std::uint64_t part_number, std::uint64_t total_parts) {
    queue_.push(StartPartEvent{part_number, total_parts});
}

void QueueReporter::report_finish_part(std::uint64_t part_number, std::uint64_t total_parts) {
    queue_.push(FinishPartEvent{part_number, total_parts});
}

void QueueReporter::report_file_progress(std::uint64_t written_bytes, std::uint64_t total_bytes) {
    if (!progress_limiter_.allow()) {
        return;
    }
    queue_.push(FileProgressEvent{written_bytes, total_bytes});
}

void QueueReporter::report_archive_bit(const std::optional<std::string>& error_message) {
    queue_.push(ArchiveBitEvent{error_message});
}

}  // namespace nsp_split
