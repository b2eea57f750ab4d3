#include <cstdio>
#include <system_error>

#include "../path/path_utils.hpp"
#include "../process/process.hpp"

#include "./nyuu.hpp"

bool is_success_exit_code(int exit_code) {
    return exit_code == 0 || exit_code == NYUU_EXIT_CODE_WARNING;
}

// rename falls back to copy when the archive is on another file system
static std::optional<std::string> move_file(const std::filesystem::path &from, const std::filesystem::path &to) {
    std::error_code ec;
    std::filesystem::create_directories(to.parent_path(), ec);
    if (ec) {
        return "Failed to create \"" + to.parent_path().string() + "\": " + ec.message();
    }
    std::filesystem::rename(from, to, ec);
    if (!ec) {
        return std::nullopt;
    }
    std::filesystem::copy_file(from, to, std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
        return "Failed to move \"" + from.string() + "\" to \"" + to.string() + "\": " + ec.message();
    }
    std::filesystem::remove(from, ec);
    return std::nullopt;
}

static void delete_files(const std::vector<std::filesystem::path> &files) {
    for (const auto &f : files) {
        std::error_code ec;
        std::filesystem::remove(f, ec);
        if (ec) {
            fprintf(stderr, "Could not delete \"%s\": %s\n", f.string().c_str(), ec.message().c_str());
        }
    }
}

UsenetPoster::UsenetPoster(const run_config_t &config_) : config {config_} {}

post_result_t UsenetPoster::post(const std::filesystem::path &file, const std::vector<std::filesystem::path> &par2_files, const post_options_t &options) const {
    const auto manifest = make_manifest_name(file, config.input, options.bdmv_naming);

    std::vector<std::string> args {
        config.nyuu_bin.string(),
        "--config", config.nyuu_config.string(),
        "--out", manifest.working_name,
        file.string()
    };
    for (const auto &p : par2_files) {
        args.push_back(p.string());
    }
    if (config.debug) {
        fprintf(stdout, "%s\n", join_command_line(args).c_str());
    }

    // this is where the manifest is written
    const auto cwd = options.workdir.has_value() ? options.workdir.value() : file.parent_path();
    const auto process = run_process(args, cwd, config.debug);
    post_result_t result {process.args, process.exit_code, false, std::nullopt, process.out, process.err};
    if (!is_success_exit_code(process.exit_code)) {
        return result;
    }

    const auto src = cwd / manifest.working_name;
    const auto dst = make_archive_path(config.nzb_output_path, scope_name(config.scope), config.input, file, manifest.name);
    std::error_code ec;
    if (!std::filesystem::is_regular_file(src, ec)) {
        result.err += "\nManifest \"" + src.string() + "\" was not created";
        return result;
    }
    const auto move_error = move_file(src, dst);
    if (move_error.has_value()) {
        result.err += "\n" + move_error.value();
        return result;
    }
    if (config.debug) {
        fprintf(stdout, "NZB Move: %s -> %s\n", src.string().c_str(), dst.string().c_str());
    }

    if (options.delete_par2_files) {
        delete_files(par2_files);
    }
    result.success = true;
    result.nzb = dst;
    return result;
}

post_result_t UsenetPoster::repost(const std::filesystem::path &article) const {
    const std::vector<std::string> args {
        config.nyuu_bin.string(),
        "--config", config.nyuu_config.string(),
        "--delete-raw-posts",
        "--input-raw-posts", std::filesystem::absolute(article).string()
    };
    if (config.debug) {
        fprintf(stdout, "%s\n", join_command_line(args).c_str());
    }

    const auto process = run_process(args, std::nullopt, config.debug);
    return post_result_t {
        process.args,
        process.exit_code,
        is_success_exit_code(process.exit_code),
        std::nullopt,
        process.out,
        process.err
    };
}
