#include <cstdio>
#include <system_error>

#include "../files/files.hpp"
#include "../path/path_utils.hpp"

#include "./pipeline.hpp"

UploadPipeline::UploadPipeline(
    const run_config_t &config_,
    std::shared_ptr<ResumeLedger> ledger_,
    std::shared_ptr<Par2Generator> generator_,
    std::shared_ptr<UsenetPoster> poster_,
    std::shared_ptr<RawArticles> raw_articles_,
    ProgressObserver observer_,
    std::function<bool()> is_cancelled_) :
    config {config_},
    ledger {ledger_},
    generator {generator_},
    poster {poster_},
    raw_articles {raw_articles_},
    observer {observer_},
    is_cancelled {is_cancelled_} {}

void UploadPipeline::notify(const ProgressEvent &event) const {
    if (observer) {
        observer(event);
    }
}

bool UploadPipeline::cancelled() const {
    return is_cancelled && is_cancelled();
}

void UploadPipeline::finish(run_report_t &report, run_status_t status, const std::string &message, bool error) const {
    report.status = status;
    report.message = message;
    if (error) {
        fprintf(stderr, "%s\n", message.c_str());
    } else {
        fprintf(stdout, "%s\n", message.c_str());
    }
}

bool UploadPipeline::skip_uploaded(const std::filesystem::path &file, const std::vector<progress_stage_t> &stages) {
    if (!ledger->is_recorded(config.scope, file)) {
        return false;
    }
    const auto name = file.filename().string();
    fprintf(stdout, "Skipping: %s - Already uploaded\n", name.c_str());
    for (const auto stage : stages) {
        notify(ProgressItemDone {stage, name, true, true});
    }
    return true;
}

std::variant<std::vector<std::filesystem::path>, std::string> UploadPipeline::select_files(run_report_t &report) {
    auto files = filter_par2_files(discover_files(config));
    if (files.empty()) {
        finish(report, RUN_STATUS_NO_MATCHING_FILES, "No matching files/folders found in: " + config.input.string(), true);
        return files;
    }

    if (config.mode == RUN_MODE_ONLY_MOVE || config.move) {
        fprintf(stdout, "Moving file(s)\n");
        const auto move_ret = move_files(files);
        if (std::holds_alternative<std::string>(move_ret)) {
            return std::get<std::string>(move_ret);
        }
        fprintf(stdout, "File(s) moved successfully\n");
        if (config.mode == RUN_MODE_ONLY_MOVE) {
            finish(report, RUN_STATUS_MOVED, "Moved " + std::to_string(std::get<std::vector<std::filesystem::path>>(move_ret).size()) + " file(s)");
            return std::vector<std::filesystem::path> {};
        }
        // pick up the new locations
        files = filter_par2_files(discover_files(config));
    }

    const auto total = files.size();
    files = filter_empty_files(files);
    if (config.debug) {
        fprintf(stdout, "Total files: %zu, empty: %zu\n", total, total - files.size());
    }
    if (files.empty()) {
        finish(report, RUN_STATUS_EFFECTIVELY_EMPTY,
            "Matching files/folders found, but they are either empty or contain only 0-byte files, making them effectively empty", true);
        return files;
    }

    files = ledger->filter_unrecorded(config.scope, files);
    if (files.empty()) {
        finish(report, RUN_STATUS_ALREADY_UPLOADED,
            "Matching files/folders found, but they were already uploaded before. You can force upload these with --no-resume");
    }
    return files;
}

void UploadPipeline::only_generate(const std::vector<std::filesystem::path> &files, run_report_t &report) {
    notify(ProgressStageStarted {PROGRESS_STAGE_GENERATE, files.size()});
    for (const auto &file : files) {
        if (cancelled()) {
            finish(report, RUN_STATUS_CANCELLED, "Interrupted", true);
            return;
        }
        if (skip_uploaded(file, {PROGRESS_STAGE_GENERATE})) {
            continue;
        }
        // par2 files are kept next to the input when they are not posted right away
        const auto result = generator->generate(file, std::nullopt);
        const auto name = file.filename().string();
        if (result.success) {
            fprintf(stdout, "Generated %s\n", name.c_str());
        } else {
            fprintf(stderr, "Failed to generate %s (exit code %d)\n", name.c_str(), result.exit_code);
        }
        notify(ProgressItemDone {PROGRESS_STAGE_GENERATE, name, result.success, false});
        report.files.insert(file, file_outcome_t {result, std::nullopt});
    }
}

void UploadPipeline::only_post(const std::vector<std::filesystem::path> &files, run_report_t &report) {
    notify(ProgressStageStarted {PROGRESS_STAGE_POST, files.size()});
    for (const auto &file : files) {
        if (cancelled()) {
            finish(report, RUN_STATUS_CANCELLED, "Interrupted", true);
            return;
        }
        if (skip_uploaded(file, {PROGRESS_STAGE_POST})) {
            continue;
        }
        const auto par2_files = find_par2_files(file.parent_path(), file.filename().string());
        const auto result = poster->post(file, par2_files, post_options_t {config.bdmv, config.delete_par2_on_success, std::nullopt});
        const auto name = file.filename().string();
        // a finished post is always recorded, cancellation applies to the next file
        if (result.success) {
            ledger->record(config.scope, file);
            fprintf(stdout, "Posted %s\n", name.c_str());
        } else {
            fprintf(stderr, "Failed to post %s (exit code %d)\n", name.c_str(), result.exit_code);
        }
        notify(ProgressItemDone {PROGRESS_STAGE_POST, name, result.success, false});
        report.files.insert(file, file_outcome_t {std::nullopt, result});
        if (cancelled()) {
            finish(report, RUN_STATUS_CANCELLED, "Interrupted", true);
            return;
        }
    }
}

std::optional<std::string> UploadPipeline::generate_and_post(const std::vector<std::filesystem::path> &files, run_report_t &report) {
    notify(ProgressStageStarted {PROGRESS_STAGE_GENERATE, files.size()});
    notify(ProgressStageStarted {PROGRESS_STAGE_POST, files.size()});
    for (const auto &file : files) {
        if (cancelled()) {
            finish(report, RUN_STATUS_CANCELLED, "Interrupted", true);
            return std::nullopt;
        }
        if (skip_uploaded(file, {PROGRESS_STAGE_GENERATE, PROGRESS_STAGE_POST})) {
            continue;
        }
        const auto name = file.filename().string();
        const auto workdir_ret = make_file_work_dir(file);
        if (std::holds_alternative<std::string>(workdir_ret)) {
            return std::get<std::string>(workdir_ret);
        }
        const auto &workdir = std::get<std::optional<std::filesystem::path>>(workdir_ret);

        file_outcome_t outcome;
        outcome.generate = generator->generate(file, workdir);
        if (!outcome.generate->success) {
            fprintf(stderr, "Failed to generate %s (exit code %d)\n", name.c_str(), outcome.generate->exit_code);
        }
        notify(ProgressItemDone {PROGRESS_STAGE_GENERATE, name, outcome.generate->success, false});

        if (!outcome.generate->success && !config.post_on_generate_failure) {
            notify(ProgressItemDone {PROGRESS_STAGE_POST, name, false, false});
            report.files.insert(file, outcome);
            continue;
        }
        // a file which was never posted is left out of the report
        if (cancelled()) {
            finish(report, RUN_STATUS_CANCELLED, "Interrupted", true);
            return std::nullopt;
        }

        // a failed generation still posts whatever par2 files exist, the post decides the outcome
        outcome.post = poster->post(file, outcome.generate->par2_files, post_options_t {config.bdmv, config.delete_par2_on_success, workdir});
        if (outcome.post->success) {
            ledger->record(config.scope, file);
            fprintf(stdout, "Posted %s\n", name.c_str());
            remove_file_work_dir(workdir);
        } else {
            fprintf(stderr, "Failed to post %s (exit code %d)\n", name.c_str(), outcome.post->exit_code);
        }
        notify(ProgressItemDone {PROGRESS_STAGE_POST, name, outcome.post->success, false});
        report.files.insert(file, outcome);
        if (cancelled()) {
            finish(report, RUN_STATUS_CANCELLED, "Interrupted", true);
            return std::nullopt;
        }
    }
    return std::nullopt;
}

std::variant<std::optional<std::filesystem::path>, std::string> UploadPipeline::make_file_work_dir(const std::filesystem::path &file) const {
    if (!config.work_dir.has_value()) {
        return std::optional<std::filesystem::path> {};
    }
    // files with the same name in different folders must not share par2 files
    auto relative = path_to_relative(file, config.input);
    if (relative.empty() || relative.is_absolute()) {
        relative = file.filename();
    }
    const auto dir = config.work_dir.value() / relative;
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        return "Failed to create working directory \"" + dir.string() + "\": " + ec.message();
    }
    return std::optional<std::filesystem::path> {dir};
}

void UploadPipeline::remove_file_work_dir(const std::optional<std::filesystem::path> &dir) const {
    if (!dir.has_value()) {
        return;
    }
    // fails on a folder which is not empty
    std::error_code ec;
    std::filesystem::remove(dir.value(), ec);
}

void UploadPipeline::recover_raw_articles(run_report_t &report) {
    report.articles = raw_articles->recover_all(observer, is_cancelled);
    size_t failed = 0;
    for (const auto &a : report.articles.items()) {
        if (!a.second.success) {
            failed++;
        }
    }
    if (failed > 0) {
        fprintf(stderr, "%zu of %zu raw article(s) could not be reposted\n", failed, report.articles.size());
    }
}

std::variant<run_report_t, std::string> UploadPipeline::run() {
    run_report_t report;

    if (config.mode == RUN_MODE_CLEAR_RAW) {
        report.cleared_count = raw_articles->clear_all();
        finish(report, RUN_STATUS_CLEARED_RAW, "Deleted " + std::to_string(report.cleared_count) + " raw article(s)");
        return report;
    }

    if (config.mode == RUN_MODE_CLEAR_RESUME) {
        if (config.clear_resume_scoped) {
            ledger->clear(config.scope);
            finish(report, RUN_STATUS_CLEARED_RESUME, "Cleared " + scope_name(config.scope) + " resume data");
        } else {
            ledger->clear();
            finish(report, RUN_STATUS_CLEARED_RESUME, "Cleared resume data");
        }
        return report;
    }

    const auto raw_count = raw_articles->list_pending().size();

    if (config.mode == RUN_MODE_ONLY_RAW) {
        if (raw_count == 0) {
            finish(report, RUN_STATUS_NO_RAW_ARTICLES, "No raw articles available for reposting");
            return report;
        }
        recover_raw_articles(report);
        if (cancelled()) {
            finish(report, RUN_STATUS_CANCELLED, "Interrupted", true);
        }
        return report;
    }

    const auto files_ret = select_files(report);
    if (std::holds_alternative<std::string>(files_ret)) {
        return std::get<std::string>(files_ret);
    }
    const auto &files = std::get<std::vector<std::filesystem::path>>(files_ret);
    if (files.empty()) {
        return report;
    }
    if (config.debug) {
        fprintf(stdout, "Total files left: %zu\n", files.size());
    }

    if (config.mode == RUN_MODE_ONLY_GENERATE) {
        only_generate(files, report);
        return report;
    }
    if (config.mode == RUN_MODE_ONLY_POST) {
        only_post(files, report);
        return report;
    }

    if (config.work_dir.has_value()) {
        std::error_code ec;
        std::filesystem::create_directories(config.work_dir.value(), ec);
        if (ec) {
            return "Failed to create working directory \"" + config.work_dir->string() + "\": " + ec.message();
        }
    }

    if (config.mode == RUN_MODE_SKIP_RAW) {
        fprintf(stdout, "Raw article checking and reposting is being skipped\n");
    } else if (raw_count > 0) {
        fprintf(stdout, "Found %zu raw article(s). Attempting to repost...\n", raw_count);
        recover_raw_articles(report);
        if (cancelled()) {
            finish(report, RUN_STATUS_CANCELLED, "Interrupted", true);
            return report;
        }
    }

    const auto post_ret = generate_and_post(files, report);
    if (post_ret.has_value()) {
        return post_ret.value();
    }
    return report;
}
