#include "split_error.hpp"

namespace nsp_split {

const char* to_string(SplitErrorKind kind) {
    switch (kind) {
    case SplitErrorKind::InvalidInput:
        return "InvalidInput";
    case SplitErrorKind::InvalidOutput:
        return "InvalidOutput";
    case SplitErrorKind::InsufficientSpace:
        return "InsufficientSpace";
    case SplitErrorKind::SplitNotNeeded:
        return "SplitNotNeeded";
    case SplitErrorKind::IoFailure:
        return "IoFailure";
    case SplitErrorKind::Cancelled:
        return "Cancelled";
    case SplitErrorKind::Unexpected:
        return "Unexpected";
    }
    return "Unexpected";
}

SplitError::SplitError(SplitErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

std::string describe(SplitErrorKind kind, const std::string& message) {
    std::string out = "SplitError(";
    out += to_string(kind);
    out += ", \"";
    for (char c : message) {
        if (c == '"' || c == '\\') {
            out.push_back('\\');
        }
        out.push_back(c);
    }
    out += "\")";
    return out;
}

std::string describe(const SplitError& error) {
    return describe(error.kind(), error.what());
}

}  // namespace nsp_split
