#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>

#include "../config/config.hpp"

struct generate_result_t {
    std::vector<std::string> args;
    int exit_code;
    bool success;
    // par2 files found after the run. Might be partial if generation failed
    std::vector<std::filesystem::path> par2_files;
    std::string out;
    std::string err;
};

// NOTE: Par2Generator is not thread-safe

class Par2Generator {
public:
    Par2Generator(const run_config_t &config_);

    // par2 files are written to workdir, or next to the input if workdir is not set
    generate_result_t generate(const std::filesystem::path &file, const std::optional<std::filesystem::path> &workdir) const;

    std::vector<std::string> make_command(const std::filesystem::path &file, const std::filesystem::path &output_directory) const;

private:
    const run_config_t config;
};

// par2 files generated for an input called `name`: "<name>.par2" and "<name>.vol*.par2", sorted
std::vector<std::filesystem::path> find_par2_files(const std::filesystem::path &directory, const std::string &name);

bool is_par2_file(const std::filesystem::path &file);
