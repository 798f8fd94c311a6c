#pragma once

#include "split_error.hpp"
#include "split_reporter.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <stop_token>
#include <string>

namespace nsp_split {

// 4 GiB minus 64 KiB: the largest part FAT32 consoles accept.
constexpr std::uint64_t kPartSize = 0xFFFF0000;
constexpr std::size_t kChunkSize = 0x8000;

struct SplitRequest {
    std::filesystem::path input_path;
    // At most one of these two may be set; with neither, the output folder is
    // created next to the input.
    std::optional<std::filesystem::path> output_dir;
    std::optional<std::filesystem::path> output_parent_dir;
    std::uint64_t part_size = kPartSize;
    std::size_t chunk_size = kChunkSize;
    std::stop_token stop_token;
};

struct PartLayout {
    std::uint64_t part_size = 0;
    std::uint64_t total_parts = 0;
    std::uint64_t total_bytes = 0;

    std::uint64_t part_length(std::uint64_t index) const;
};

PartLayout compute_layout(std::uint64_t file_size, std::uint64_t part_size = kPartSize);

// 0 -> "00", 7 -> "07", 123 -> "123"
std::string part_file_name(std::uint64_t index);

// <stem>_split<suffix>, placed per the request's output fields.
std::filesystem::path resolve_output_dir(const SplitRequest& request);

using ArchiveBitHook = std::function<bool(const std::filesystem::path&, std::string&)>;
using FreeSpaceHook = std::function<std::uintmax_t(const std::filesystem::path&)>;

// Platform collaborators of the engine. Empty members use the real
// implementations.
struct SplitHooks {
    ArchiveBitHook set_archive_bit;
    FreeSpaceHook free_space;
};

// Validates the request, then copies the input into numbered parts inside the
// resolved output directory. Throws SplitError. Nothing is created on disk
// unless every precondition holds.
void split_file(const SplitRequest& request, SplitReporter& reporter, const SplitHooks& hooks = {});

}  // namespace nsp_split
