#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>

#include "../config/config.hpp"

// Nyuu finished, but some articles failed and were dumped as raw posts
#define NYUU_EXIT_CODE_WARNING 32

struct post_options_t {
    // prefix manifest name with the parent folder of the input
    bool bdmv_naming = false;
    // delete par2 files after a successful post
    bool delete_par2_files = true;
    // where the poster runs and writes the manifest. Unset - next to the input
    std::optional<std::filesystem::path> workdir;
};

struct post_result_t {
    std::vector<std::string> args;
    int exit_code;
    bool success;
    // archived manifest, set only on success. Not used for raw reposts
    std::optional<std::filesystem::path> nzb;
    std::string out;
    std::string err;
};

// true for exit codes treated as a successful post
bool is_success_exit_code(int exit_code);

// NOTE: UsenetPoster is not thread-safe

class UsenetPoster {
public:
    UsenetPoster(const run_config_t &config_);

    post_result_t post(const std::filesystem::path &file, const std::vector<std::filesystem::path> &par2_files, const post_options_t &options) const;

    // reposts a raw article left by a failed post. The poster deletes the article on success
    post_result_t repost(const std::filesystem::path &article) const;

private:
    const run_config_t config;
};
