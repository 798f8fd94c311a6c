#pragma once

#include "split_error.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace nsp_split {

struct InitialInfoEvent {
    std::uint64_t total_parts = 0;
    std::uint64_t total_bytes = 0;
};

struct StartPartEvent {
    std::uint64_t part_number = 0;
    std::uint64_t total_parts = 0;
};

struct FinishPartEvent {
    std::uint64_t part_number = 0;
    std::uint64_t total_parts = 0;
};

struct FileProgressEvent {
    std::uint64_t written_bytes = 0;
    std::uint64_t total_bytes = 0;
};

struct ArchiveBitEvent {
    std::optional<std::string> error_message;
};

struct NormalExitEvent {};

struct ExceptionExitEvent {
    SplitErrorKind kind = SplitErrorKind::Unexpected;
    std::string message;
    std::string debug;
};

using ProgressEvent = std::variant<
    InitialInfoEvent,
    StartPartEvent,
    FinishPartEvent,
    FileProgressEvent,
    ArchiveBitEvent,
    NormalExitEvent,
    ExceptionExitEvent>;

// Terminal events are the last thing a worker pushes for a run.
inline bool is_terminal(const ProgressEvent& event) {
    return std::holds_alternative<NormalExitEvent>(event) ||
        std::holds_alternative<ExceptionExitEvent>(event);
}

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

}  // namespace nsp_split
