#include "split_engine.hpp"

#include "archive_bit.hpp"

#include <algorithm>
#include <exception>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>
#include <vector>

namespace nsp_split {
namespace {

namespace fs = std::filesystem;

struct ValidatedSplit {
    fs::path output_dir;
    std::uint64_t file_size = 0;
};

std::uintmax_t query_free_space(const fs::path& dir, const SplitHooks& hooks) {
    if (hooks.free_space) {
        return hooks.free_space(dir);
    }

    std::error_code ec;
    const fs::space_info info = fs::space(dir, ec);
    if (ec) {
        throw SplitError(
            SplitErrorKind::IoFailure,
            "Failed to query free space on " + dir.string() + ": " + ec.message()
        );
    }
    return info.available;
}

ValidatedSplit validate_request(const SplitRequest& request, const SplitHooks& hooks) {
    if (request.output_dir && request.output_parent_dir) {
        throw SplitError(
            SplitErrorKind::InvalidOutput,
            "An output directory and an output parent directory cannot both be given"
        );
    }
    if (request.part_size == 0 || request.chunk_size == 0) {
        throw SplitError(SplitErrorKind::InvalidInput, "Part size and chunk size must be positive");
    }

    std::error_code ec;
    if (!fs::is_regular_file(request.input_path, ec)) {
        throw SplitError(SplitErrorKind::InvalidInput, request.input_path.string() + " is not a file");
    }

    ValidatedSplit out;
    out.output_dir = resolve_output_dir(request);

    if (fs::exists(out.output_dir, ec)) {
        if (!fs::is_directory(out.output_dir, ec)) {
            throw SplitError(SplitErrorKind::InvalidOutput, out.output_dir.string() + " is not a folder");
        }
        const bool empty = fs::is_empty(out.output_dir, ec);
        if (ec) {
            throw SplitError(
                SplitErrorKind::InvalidOutput,
                "Cannot inspect " + out.output_dir.string() + ": " + ec.message()
            );
        }
        if (!empty) {
            throw SplitError(SplitErrorKind::InvalidOutput, out.output_dir.string() + " is not empty");
        }
    } else if (ec) {
        throw SplitError(
            SplitErrorKind::InvalidOutput,
            "Cannot inspect " + out.output_dir.string() + ": " + ec.message()
        );
    }

    out.file_size = fs::file_size(request.input_path, ec);
    if (ec) {
        throw SplitError(
            SplitErrorKind::IoFailure,
            "Failed to read size of " + request.input_path.string() + ": " + ec.message()
        );
    }

    fs::path volume = fs::absolute(request.input_path, ec).parent_path();
    if (ec || volume.empty()) {
        volume = fs::current_path();
    }
    const std::uintmax_t free_bytes = query_free_space(volume, hooks);
    if (free_bytes < out.file_size || free_bytes - out.file_size < out.file_size) {
        throw SplitError(
            SplitErrorKind::InsufficientSpace,
            "Not enough free space to run. Will require twice the space as the input file"
        );
    }

    if (out.file_size <= request.part_size) {
        throw SplitError(
            SplitErrorKind::SplitNotNeeded,
            "This file is under 4GiB and does not need to be split."
        );
    }

    return out;
}

void copy_part(
    std::ifstream& in,
    const fs::path& part_path,
    std::uint64_t part_length,
    const SplitRequest& request,
    std::vector<char>& buffer,
    std::uint64_t& total_written,
    std::uint64_t total_bytes,
    SplitReporter& reporter
) {
    std::ofstream out(part_path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw SplitError(SplitErrorKind::IoFailure, "Failed to open output part: " + part_path.string());
    }

    std::uint64_t part_written = 0;
    while (part_written < part_length) {
        if (request.stop_token.stop_requested()) {
            throw SplitError(SplitErrorKind::Cancelled, "Split cancelled");
        }

        const std::size_t this_chunk = static_cast<std::size_t>(
            std::min<std::uint64_t>(buffer.size(), part_length - part_written)
        );
        in.read(buffer.data(), static_cast<std::streamsize>(this_chunk));
        if (in.gcount() != static_cast<std::streamsize>(this_chunk)) {
            throw SplitError(
                SplitErrorKind::IoFailure,
                "Unexpected end of input while reading " + request.input_path.string()
            );
        }

        out.write(buffer.data(), static_cast<std::streamsize>(this_chunk));
        if (!out) {
            throw SplitError(SplitErrorKind::IoFailure, "Failed to write " + part_path.string());
        }

        part_written += this_chunk;
        total_written += this_chunk;
        reporter.report_file_progress(total_written, total_bytes);
    }

    out.close();
    if (out.fail()) {
        throw SplitError(SplitErrorKind::IoFailure, "Failed to close " + part_path.string());
    }
}

std::optional<std::string> run_archive_bit_step(const fs::path& output_dir, const SplitHooks& hooks) {
    std::string error;
    bool ok = false;
    try {
        ok = hooks.set_archive_bit ? hooks.set_archive_bit(output_dir, error)
                                   : try_set_archive_bit(output_dir, error);
    } catch (const std::exception& ex) {
        ok = false;
        error = ex.what();
    }

    if (ok) {
        return std::nullopt;
    }
    return error.empty() ? std::string("unknown error") : error;
}

}  // namespace

std::uint64_t PartLayout::part_length(std::uint64_t index) const {
    if (index >= total_parts) {
        return 0;
    }
    const std::uint64_t start = index * part_size;
    return std::min(part_size, total_bytes - start);
}

PartLayout compute_layout(std::uint64_t file_size, std::uint64_t part_size) {
    PartLayout layout;
    layout.part_size = part_size;
    layout.total_bytes = file_size;
    layout.total_parts = part_size == 0 ? 0 : (file_size + part_size - 1) / part_size;
    return layout;
}

std::string part_file_name(std::uint64_t index) {
    std::ostringstream ss;
    ss << std::setw(2) << std::setfill('0') << index;
    return ss.str();
}

fs::path resolve_output_dir(const SplitRequest& request) {
    if (request.output_dir) {
        return *request.output_dir;
    }

    const fs::path& input = request.input_path;
    const std::string name = input.stem().string() + "_split" + input.extension().string();
    if (request.output_parent_dir) {
        return *request.output_parent_dir / name;
    }
    return input.parent_path() / name;
}

void split_file(const SplitRequest& request, SplitReporter& reporter, const SplitHooks& hooks) {
    const ValidatedSplit validated = validate_request(request, hooks);

    std::error_code ec;
    fs::create_directories(validated.output_dir, ec);
    if (ec) {
        throw SplitError(
            SplitErrorKind::IoFailure,
            "Failed to create " + validated.output_dir.string() + ": " + ec.message()
        );
    }

    const PartLayout layout = compute_layout(validated.file_size, request.part_size);
    reporter.report_initial_info(layout.total_parts, layout.total_bytes);

    std::ifstream in(request.input_path, std::ios::binary);
    if (!in) {
        throw SplitError(SplitErrorKind::IoFailure, "Failed to open " + request.input_path.string());
    }

    std::vector<char> buffer(request.chunk_size);
    std::uint64_t total_written = 0;

    for (std::uint64_t i = 0; i < layout.total_parts; ++i) {
        reporter.report_start_part(i, layout.total_parts);
        copy_part(
            in,
            validated.output_dir / part_file_name(i),
            layout.part_length(i),
            request,
            buffer,
            total_written,
            layout.total_bytes,
            reporter
        );
        reporter.report_finish_part(i, layout.total_parts);
    }

    reporter.report_archive_bit(run_archive_bit_step(validated.output_dir, hooks));
}

}  // namespace nsp_split
