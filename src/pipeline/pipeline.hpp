#pragma once

#include <memory>
#include <string>
#include <vector>
#include <variant>
#include <optional>
#include <functional>
#include <filesystem>

#include "../config/config.hpp"
#include "../resume/resume.hpp"
#include "../parpar/parpar.hpp"
#include "../nyuu/nyuu.hpp"
#include "../raw/raw_articles.hpp"
#include "../report/report.hpp"
#include "../report/progress.hpp"

// NOTE: UploadPipeline is not thread-safe. Files are processed one at a time.

class UploadPipeline {
public:
    // is_cancelled_ is polled between files and articles. A cancelled run stops
    // before the next item and does not record the file in flight
    UploadPipeline(
        const run_config_t &config_,
        std::shared_ptr<ResumeLedger> ledger_,
        std::shared_ptr<Par2Generator> generator_,
        std::shared_ptr<UsenetPoster> poster_,
        std::shared_ptr<RawArticles> raw_articles_,
        ProgressObserver observer_ = nullptr,
        std::function<bool()> is_cancelled_ = nullptr);

    // runs the configured mode once.
    // per-file failures are part of the report, only fatal errors are returned as a string.
    // resume storage errors are thrown
    std::variant<run_report_t, std::string> run();

protected:
    // candidate files after discovery, moving and filtering. Sets report status if nothing is left
    std::variant<std::vector<std::filesystem::path>, std::string> select_files(run_report_t &report);

    void only_generate(const std::vector<std::filesystem::path> &files, run_report_t &report);
    void only_post(const std::vector<std::filesystem::path> &files, run_report_t &report);
    // returns an error if the working directory could not be created
    std::optional<std::string> generate_and_post(const std::vector<std::filesystem::path> &files, run_report_t &report);
    void recover_raw_articles(run_report_t &report);

    // <work_dir>/<path of the file relative to the input>, unset if generated files are kept next to the input
    std::variant<std::optional<std::filesystem::path>, std::string> make_file_work_dir(const std::filesystem::path &file) const;
    void remove_file_work_dir(const std::optional<std::filesystem::path> &dir) const;

    // logs and reports files recorded by a concurrent run
    bool skip_uploaded(const std::filesystem::path &file, const std::vector<progress_stage_t> &stages);
    void notify(const ProgressEvent &event) const;
    bool cancelled() const;
    // prints the message and sets it as the final status of the report
    void finish(run_report_t &report, run_status_t status, const std::string &message, bool error = false) const;

private:
    const run_config_t config;
    std::shared_ptr<ResumeLedger> ledger;
    std::shared_ptr<Par2Generator> generator;
    std::shared_ptr<UsenetPoster> poster;
    std::shared_ptr<RawArticles> raw_articles;
    ProgressObserver observer;
    std::function<bool()> is_cancelled;
};
