#include <cstdlib>
#include <fstream>
#include <regex>
#include <sstream>
#include <system_error>

#include <nlohmann/json.hpp>

#include "../files/files.hpp"

#include "./config.hpp"

#define APPDATA_DIR_NAME ".usenet-uploader"
#define TEMP_DIR_NAME "usenet-uploader"

static const std::vector<std::string> default_extensions = {"mkv"};

static const std::vector<std::string> default_parpar_args = {
    "--overwrite",
    "-s700k",
    "--slice-size-multiple=700K",
    "--max-input-slices=4000",
    "-r1n*1.2",
    "-R"
};

std::string scope_name(upload_scope_t scope) {
    return scope == UPLOAD_SCOPE_PUBLIC ? "public" : "private";
}

std::string mode_name(run_mode_t mode) {
    switch (mode) {
        case RUN_MODE_CLEAR_RESUME:
            return "clear-resume";
        case RUN_MODE_CLEAR_RAW:
            return "clear-raw";
        case RUN_MODE_ONLY_RAW:
            return "only-raw";
        case RUN_MODE_ONLY_MOVE:
            return "only-move";
        case RUN_MODE_ONLY_GENERATE:
            return "only-generate";
        case RUN_MODE_ONLY_POST:
            return "only-post";
        case RUN_MODE_SKIP_RAW:
            return "skip-raw";
        case RUN_MODE_DEFAULT:
            break;
    }
    return "default";
}

std::variant<run_mode_t, std::string> resolve_run_mode(const mode_flags_t &flags) {
    const std::vector<std::pair<bool, run_mode_t>> switches = {
        {flags.clear_resume, RUN_MODE_CLEAR_RESUME},
        {flags.clear_raw, RUN_MODE_CLEAR_RAW},
        {flags.only_raw, RUN_MODE_ONLY_RAW},
        {flags.only_move, RUN_MODE_ONLY_MOVE},
        {flags.only_generate, RUN_MODE_ONLY_GENERATE},
        {flags.only_post, RUN_MODE_ONLY_POST},
        {flags.skip_raw, RUN_MODE_SKIP_RAW}
    };
    auto mode = RUN_MODE_DEFAULT;
    std::string active;
    for (const auto &s : switches) {
        if (!s.first) {
            continue;
        }
        if (mode != RUN_MODE_DEFAULT) {
            return std::string("More than one mutually exclusive option is set: --") + active + " and --" + mode_name(s.second);
        }
        mode = s.second;
        active = mode_name(s.second);
    }
    return mode;
}

static std::filesystem::path absolute_path(const std::filesystem::path &path) {
    if (path.empty()) {
        return path;
    }
    return std::filesystem::absolute(path).lexically_normal();
}

// binaries given as a bare name are looked up in PATH by the process runner
static std::filesystem::path binary_path(const std::filesystem::path &path) {
    if (!path.has_parent_path()) {
        return path;
    }
    return absolute_path(path);
}

static std::filesystem::path default_appdata_dir() {
    const auto home = std::getenv("HOME");
    if (home == nullptr || std::string(home).empty()) {
        return absolute_path(APPDATA_DIR_NAME);
    }
    return std::filesystem::path(home) / APPDATA_DIR_NAME;
}

static std::filesystem::path default_temp_dir() {
    std::error_code ec;
    const auto tmp = std::filesystem::temp_directory_path(ec);
    if (ec) {
        return absolute_path(TEMP_DIR_NAME);
    }
    return tmp / TEMP_DIR_NAME;
}

template<class T>
static std::optional<std::string> read_key(const nlohmann::json &data, const std::string &key, T &value) {
    const auto it = data.find(key);
    if (it == data.end() || it->is_null()) {
        return std::nullopt;
    }
    try {
        value = it->get<T>();
    } catch (const nlohmann::json::exception &e) {
        return std::string("Invalid value for \"") + key + "\": " + e.what();
    }
    return std::nullopt;
}

static std::optional<std::string> read_path_key(const nlohmann::json &data, const std::string &key, std::filesystem::path &value) {
    std::string str = value.string();
    const auto err = read_key(data, key, str);
    if (err.has_value()) {
        return err;
    }
    value = std::filesystem::path(str);
    return std::nullopt;
}

std::variant<app_config_t, std::string> parse_app_config(const std::string &json_text) {
    nlohmann::json data;
    try {
        data = nlohmann::json::parse(json_text);
    } catch (const nlohmann::json::parse_error &e) {
        return std::string("Failed to parse config: ") + e.what();
    }
    if (!data.is_object()) {
        return std::string("Config must be a JSON object");
    }

    app_config_t config {
        "parpar",
        "nyuu",
        {},
        {},
        "nzbs",
        default_extensions,
        default_parpar_args,
        true,
        default_temp_dir(),
        default_appdata_dir(),
        true,
        true,
        false
    };

    std::vector<std::optional<std::string>> errors;
    errors.push_back(read_path_key(data, "parpar", config.parpar));
    errors.push_back(read_path_key(data, "nyuu", config.nyuu));
    errors.push_back(read_path_key(data, "nyuu_config_private", config.nyuu_config_private));
    errors.push_back(read_path_key(data, "nyuu_config_public", config.nyuu_config_public));
    errors.push_back(read_path_key(data, "nzb_output_path", config.nzb_output_path));
    errors.push_back(read_key(data, "extensions", config.extensions));
    errors.push_back(read_key(data, "parpar_args", config.parpar_args));
    errors.push_back(read_key(data, "use_temp_dir", config.use_temp_dir));
    errors.push_back(read_path_key(data, "temp_dir_path", config.temp_dir_path));
    errors.push_back(read_path_key(data, "appdata_dir_path", config.appdata_dir_path));
    errors.push_back(read_key(data, "delete_par2_on_success", config.delete_par2_on_success));
    errors.push_back(read_key(data, "post_on_generate_failure", config.post_on_generate_failure));
    errors.push_back(read_key(data, "clear_resume_scoped", config.clear_resume_scoped));
    for (const auto &e : errors) {
        if (e.has_value()) {
            return e.value();
        }
    }

    if (config.nyuu_config_private.empty()) {
        return std::string("\"nyuu_config_private\" is not set");
    }
    if (config.nyuu_config_public.empty()) {
        config.nyuu_config_public = config.nyuu_config_private;
    }

    config.parpar = binary_path(config.parpar);
    config.nyuu = binary_path(config.nyuu);
    config.nyuu_config_private = absolute_path(config.nyuu_config_private);
    config.nyuu_config_public = absolute_path(config.nyuu_config_public);
    config.nzb_output_path = absolute_path(config.nzb_output_path);
    config.temp_dir_path = absolute_path(config.temp_dir_path);
    config.appdata_dir_path = absolute_path(config.appdata_dir_path);
    return config;
}

// returns an error message if the file could not be read
static std::optional<std::string> read_text_file(const std::filesystem::path &path, std::string &content) {
    std::ifstream stream(path, std::ios::binary);
    if (!stream) {
        return std::string("Could not open \"") + path.string() + "\"";
    }
    std::stringstream buffer;
    buffer << stream.rdbuf();
    content = buffer.str();
    return std::nullopt;
}

std::variant<app_config_t, std::string> load_app_config(const std::filesystem::path &path) {
    std::string text;
    const auto read_ret = read_text_file(path, text);
    if (read_ret.has_value()) {
        return read_ret.value();
    }
    const auto config = parse_app_config(text);
    if (std::holds_alternative<std::string>(config)) {
        return path.string() + ": " + std::get<std::string>(config);
    }
    return config;
}

std::variant<std::filesystem::path, std::string> get_dump_failed_posts(const std::filesystem::path &nyuu_config) {
    std::string text;
    const auto read_ret = read_text_file(nyuu_config, text);
    if (read_ret.has_value()) {
        return read_ret.value();
    }
    nlohmann::json data;
    try {
        data = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error &e) {
        return std::string("Failed to parse \"") + nyuu_config.string() + "\": " + e.what();
    }
    if (!data.is_object() || !data.contains("dump-failed-posts") || !data["dump-failed-posts"].is_string()) {
        return std::string("\"dump-failed-posts\" is not set in \"") + nyuu_config.string() + "\"";
    }
    return absolute_path(data["dump-failed-posts"].get<std::string>());
}

std::variant<run_config_t, std::string> make_run_config(const app_config_t &app_config, const run_options_t &options) {
    const auto mode_ret = resolve_run_mode(options.mode_flags);
    if (std::holds_alternative<std::string>(mode_ret)) {
        return std::get<std::string>(mode_ret);
    }

    const auto input = absolute_path(options.input);
    if (input.empty() || !std::filesystem::exists(input)) {
        return std::string("Input path \"") + options.input.string() + "\" does not exist";
    }

    for (const auto &pattern : options.glob) {
        if (std::filesystem::path(pattern).is_absolute()) {
            return std::string("Glob pattern \"") + pattern + "\" must be relative to the input path";
        }
        try {
            const auto regex = std::regex(glob_to_regex(pattern));
        } catch (const std::regex_error &e) {
            return std::string("Invalid glob pattern \"") + pattern + "\": " + e.what();
        }
    }

    const auto nyuu_config = options.scope == UPLOAD_SCOPE_PUBLIC ? app_config.nyuu_config_public : app_config.nyuu_config_private;
    const auto dump_ret = get_dump_failed_posts(nyuu_config);
    if (std::holds_alternative<std::string>(dump_ret)) {
        return std::get<std::string>(dump_ret);
    }

    auto resume_file = app_config.appdata_dir_path / RESUME_STORAGE_NAME;
    if (options.resume_file.has_value()) {
        resume_file = absolute_path(options.resume_file.value());
    }

    std::optional<std::filesystem::path> work_dir;
    if (app_config.use_temp_dir) {
        work_dir = app_config.temp_dir_path;
    }

    return run_config_t {
        input,
        options.scope,
        std::get<run_mode_t>(mode_ret),
        app_config.parpar,
        app_config.parpar_args,
        app_config.nyuu,
        nyuu_config,
        app_config.nzb_output_path,
        std::get<std::filesystem::path>(dump_ret),
        resume_file,
        work_dir,
        options.extensions.empty() ? app_config.extensions : options.extensions,
        options.glob,
        options.bdmv,
        options.move,
        options.no_resume,
        options.debug,
        app_config.delete_par2_on_success,
        app_config.post_on_generate_failure,
        app_config.clear_resume_scoped
    };
}
