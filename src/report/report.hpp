#pragma once

#include <string>
#include <optional>
#include <filesystem>

#include <nlohmann/json_fwd.hpp>

#include "../parpar/parpar.hpp"
#include "../nyuu/nyuu.hpp"
#include "./outcomes.hpp"

enum run_status_t {
    // files and/or raw articles were processed
    RUN_STATUS_COMPLETED = 0,
    RUN_STATUS_CLEARED_RAW,
    RUN_STATUS_CLEARED_RESUME,
    RUN_STATUS_NO_RAW_ARTICLES,
    RUN_STATUS_NO_MATCHING_FILES,
    RUN_STATUS_MOVED,
    // files were found but all of them contain only 0-byte files
    RUN_STATUS_EFFECTIVELY_EMPTY,
    RUN_STATUS_ALREADY_UPLOADED,
    RUN_STATUS_CANCELLED
};

std::string status_name(run_status_t status);

struct file_outcome_t {
    // unset in post-only mode
    std::optional<generate_result_t> generate;
    // unset in generate-only mode, or if posting was skipped after a failed generation
    std::optional<post_result_t> post;
};

// the file is successful if its last stage succeeded
bool is_successful(const file_outcome_t &outcome);

struct run_report_t {
    run_status_t status = RUN_STATUS_COMPLETED;
    std::string message;
    OrderedOutcomes<file_outcome_t> files;
    OrderedOutcomes<post_result_t> articles;
    // raw articles deleted by --clear-raw
    size_t cleared_count = 0;
};

size_t count_failures(const run_report_t &report);

nlohmann::json report_to_json(const run_report_t &report);

// returns an error if the file could not be written
std::optional<std::string> write_report(const run_report_t &report, const std::filesystem::path &path);

// lists succeeded and failed items. verbose adds captured output of failed items
void print_summary(const run_report_t &report, bool verbose);
