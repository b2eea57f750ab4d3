#pragma once

#include <string>
#include <vector>
#include <variant>
#include <optional>
#include <filesystem>

#define DEFAULT_CONFIG_FILE_NAME "usenet-uploader.json"
#define RESUME_STORAGE_NAME "resume.sqlite"

enum upload_scope_t {
    UPLOAD_SCOPE_PUBLIC = 0,
    UPLOAD_SCOPE_PRIVATE = 1
};

// "public" or "private"
std::string scope_name(upload_scope_t scope);

enum run_mode_t {
    RUN_MODE_DEFAULT = 0,
    RUN_MODE_CLEAR_RESUME,
    RUN_MODE_CLEAR_RAW,
    RUN_MODE_ONLY_RAW,
    RUN_MODE_ONLY_MOVE,
    RUN_MODE_ONLY_GENERATE,
    RUN_MODE_ONLY_POST,
    RUN_MODE_SKIP_RAW
};

std::string mode_name(run_mode_t mode);

// mutually exclusive command line switches
struct mode_flags_t {
    bool clear_resume = false;
    bool clear_raw = false;
    bool only_raw = false;
    bool only_move = false;
    bool only_generate = false;
    bool only_post = false;
    bool skip_raw = false;
};

// returns an error if more than one switch is set
std::variant<run_mode_t, std::string> resolve_run_mode(const mode_flags_t &flags);

// contents of the application config file
struct app_config_t {
    std::filesystem::path parpar;
    std::filesystem::path nyuu;
    std::filesystem::path nyuu_config_private;
    std::filesystem::path nyuu_config_public;
    std::filesystem::path nzb_output_path;
    std::vector<std::string> extensions;
    std::vector<std::string> parpar_args;
    bool use_temp_dir;
    std::filesystem::path temp_dir_path;
    std::filesystem::path appdata_dir_path;
    bool delete_par2_on_success;
    bool post_on_generate_failure;
    bool clear_resume_scoped;
};

// fills missing keys with defaults. Relative paths are resolved against the current directory
std::variant<app_config_t, std::string> parse_app_config(const std::string &json_text);

std::variant<app_config_t, std::string> load_app_config(const std::filesystem::path &path);

// reads `dump-failed-posts` from a poster (Nyuu) JSON config
std::variant<std::filesystem::path, std::string> get_dump_failed_posts(const std::filesystem::path &nyuu_config);

// options which come from the command line rather than the config file
struct run_options_t {
    std::filesystem::path input;
    upload_scope_t scope = UPLOAD_SCOPE_PRIVATE;
    mode_flags_t mode_flags;
    bool move = false;
    bool no_resume = false;
    bool bdmv = false;
    bool debug = false;
    std::vector<std::string> glob;
    std::vector<std::string> extensions;
    std::optional<std::filesystem::path> resume_file;
};

// NOTE: run_config_t is built once and never modified afterwards.
// Components keep their own copy.

struct run_config_t {
    std::filesystem::path input;
    upload_scope_t scope;
    run_mode_t mode;

    std::filesystem::path parpar_bin;
    std::vector<std::string> parpar_args;
    std::filesystem::path nyuu_bin;
    // poster config of the selected scope
    std::filesystem::path nyuu_config;
    std::filesystem::path nzb_output_path;
    std::filesystem::path raw_dump_path;
    std::filesystem::path resume_file;
    // unset if generated files should be placed next to the input
    std::optional<std::filesystem::path> work_dir;

    std::vector<std::string> extensions;
    std::vector<std::string> glob;
    bool bdmv;
    bool move;
    bool no_resume;
    bool debug;
    bool delete_par2_on_success;
    bool post_on_generate_failure;
    bool clear_resume_scoped;
};

// validates the combination of config file and command line and resolves the mode
std::variant<run_config_t, std::string> make_run_config(const app_config_t &app_config, const run_options_t &options);
