#include "config.hpp"

#include <iostream>
#include <string>

namespace nsp_split {

void print_usage(const char* program_name) {
    std::cout
        << "Usage:\n"
        << "  " << program_name << " <nsp-or-xci-file> [options]\n\n"
        << "Split NSP/XCI files into FAT32 compatible sizes.\n\n"
        << "Options:\n"
        << "  -o, --output-parent-dir <dir>  Directory in which to create the <name>_split folder\n"
        << "  --output-dir <dir>             Exact output folder (must be absent or empty)\n"
        << "  --background                   Split on a worker thread and poll its events\n"
        << "  --no-progress                  Disable progress output\n"
        << "  -h, --help                     Show this help\n";
}

bool parse_args(int argc, char** argv, AppConfig& config, std::string& error) {
    if (argc <= 1) {
        error = "No arguments provided";
        return false;
    }

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            error = "help";
            return false;
        }

        auto require_value = [&](const std::string& key) -> std::string {
            if (i + 1 >= argc) {
                error = "Missing value for " + key;
                return {};
            }
            ++i;
            return argv[i];
        };

        if (arg == "-o" || arg == "--output-parent-dir") {
            config.output_parent_dir = require_value(arg);
        } else if (arg == "--output-dir") {
            config.output_dir = require_value(arg);
        } else if (arg == "--background") {
            config.background = true;
        } else if (arg == "--no-progress") {
            config.show_progress = false;
        } else if (!arg.empty() && arg.front() == '-') {
            error = "Unknown argument: " + arg;
            return false;
        } else if (config.input_path.empty()) {
            config.input_path = arg;
        } else {
            error = "Unexpected extra argument: " + arg;
            return false;
        }

        if (!error.empty()) {
            return false;
        }
    }

    if (config.input_path.empty()) {
        error = "An input file is required";
        return false;
    }
    if (config.output_dir && config.output_parent_dir) {
        error = "--output-dir and --output-parent-dir are mutually exclusive";
        return false;
    }

    return true;
}

}  // namespace nsp_split
