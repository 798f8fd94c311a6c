#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace nsp_split {

struct AppConfig {
    std::filesystem::path input_path;
    std::optional<std::filesystem::path> output_dir;
    std::optional<std::filesystem::path> output_parent_dir;
    bool background = false;
    bool show_progress = true;
};

void print_usage(const char* program_name);
bool parse_args(int argc, char** argv, AppConfig& config, std::string& error);

}  // namespace nsp_split
