#include <algorithm>
#include <cctype>
#include <cstdio>
#include <system_error>

#include "../process/process.hpp"

#include "./parpar.hpp"

#define PAR2_EXTENSION ".par2"
#define PAR2_VOLUME_INFIX ".vol"

static inline bool starts_with(const std::string &value, const std::string &prefix) {
    return value.size() >= prefix.size() && value.compare(0, prefix.size(), prefix) == 0;
}

static inline bool ends_with(const std::string &value, const std::string &ending) {
    if (ending.size() > value.size()) return false;
    return std::equal(ending.rbegin(), ending.rend(), value.rbegin());
}

static std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return std::tolower(c); });
    return value;
}

bool is_par2_file(const std::filesystem::path &file) {
    return ends_with(to_lower(file.filename().string()), PAR2_EXTENSION);
}

std::vector<std::filesystem::path> find_par2_files(const std::filesystem::path &directory, const std::string &name) {
    std::vector<std::filesystem::path> ret;
    std::error_code ec;
    if (!std::filesystem::is_directory(directory, ec)) {
        return ret;
    }
    const auto index_name = name + PAR2_EXTENSION;
    const auto volume_prefix = name + PAR2_VOLUME_INFIX;
    for (const auto &entry : std::filesystem::directory_iterator(directory, ec)) {
        if (!entry.is_regular_file(ec)) {
            continue;
        }
        const auto entry_name = entry.path().filename().string();
        if (entry_name == index_name || (starts_with(entry_name, volume_prefix) && ends_with(entry_name, PAR2_EXTENSION))) {
            ret.push_back(entry.path());
        }
    }
    std::sort(ret.begin(), ret.end());
    return ret;
}

Par2Generator::Par2Generator(const run_config_t &config_) : config {config_} {}

std::vector<std::string> Par2Generator::make_command(const std::filesystem::path &file, const std::filesystem::path &output_directory) const {
    std::vector<std::string> args {config.parpar_bin.string()};
    args.insert(args.end(), config.parpar_args.begin(), config.parpar_args.end());
    std::error_code ec;
    if (std::filesystem::is_directory(file, ec)) {
        // keep the folder structure of a disc inside the recovery set
        args.push_back("--filepath-format");
        args.push_back("path");
        args.push_back("--filepath-base");
        args.push_back(file.parent_path().string());
    }
    args.push_back("-o");
    args.push_back((output_directory / (file.filename().string() + PAR2_EXTENSION)).string());
    args.push_back(file.string());
    return args;
}

generate_result_t Par2Generator::generate(const std::filesystem::path &file, const std::optional<std::filesystem::path> &workdir) const {
    const auto output_directory = workdir.has_value() ? workdir.value() : file.parent_path();
    const auto args = make_command(file, output_directory);
    if (config.debug) {
        fprintf(stdout, "%s\n", join_command_line(args).c_str());
    }

    const auto process = run_process(args, output_directory, config.debug);
    const auto par2_files = find_par2_files(output_directory, file.filename().string());
    return generate_result_t {
        process.args,
        process.exit_code,
        process.exit_code == 0,
        par2_files,
        process.out,
        process.err
    };
}
