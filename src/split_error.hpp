#pragma once

#include <stdexcept>
#include <string>

namespace nsp_split {

enum class SplitErrorKind {
    InvalidInput,
    InvalidOutput,
    InsufficientSpace,
    SplitNotNeeded,
    IoFailure,
    Cancelled,
    // Only produced by the background worker for faults outside the engine.
    Unexpected
};

const char* to_string(SplitErrorKind kind);

class SplitError : public std::runtime_error {
public:
    SplitError(SplitErrorKind kind, const std::string& message);

    SplitErrorKind kind() const noexcept { return kind_; }

private:
    SplitErrorKind kind_;
};

// Debug-oriented rendering, e.g. SplitError(InvalidInput, "foo is not a file").
std::string describe(SplitErrorKind kind, const std::string& message);
std::string describe(const SplitError& error);

}  // namespace nsp_split
