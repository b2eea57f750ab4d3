#include <cstdio>
#include <fstream>
#include <system_error>

#include <nlohmann/json.hpp>

#include "./report.hpp"

std::string status_name(run_status_t status) {
    switch (status) {
        case RUN_STATUS_COMPLETED:
            return "completed";
        case RUN_STATUS_CLEARED_RAW:
            return "cleared-raw";
        case RUN_STATUS_CLEARED_RESUME:
            return "cleared-resume";
        case RUN_STATUS_NO_RAW_ARTICLES:
            return "no-raw-articles";
        case RUN_STATUS_NO_MATCHING_FILES:
            return "no-matching-files";
        case RUN_STATUS_MOVED:
            return "moved";
        case RUN_STATUS_EFFECTIVELY_EMPTY:
            return "effectively-empty";
        case RUN_STATUS_ALREADY_UPLOADED:
            return "already-uploaded";
        case RUN_STATUS_CANCELLED:
            return "cancelled";
    }
    return "unknown";
}

bool is_successful(const file_outcome_t &outcome) {
    if (outcome.post.has_value()) {
        return outcome.post->success;
    }
    if (outcome.generate.has_value()) {
        return outcome.generate->success;
    }
    return false;
}

size_t count_failures(const run_report_t &report) {
    size_t failures = 0;
    for (const auto &f : report.files.items()) {
        if (!is_successful(f.second)) {
            failures++;
        }
    }
    for (const auto &a : report.articles.items()) {
        if (!a.second.success) {
            failures++;
        }
    }
    return failures;
}

static nlohmann::json generate_to_json(const generate_result_t &result) {
    std::vector<std::string> par2_files;
    for (const auto &p : result.par2_files) {
        par2_files.push_back(p.string());
    }
    return nlohmann::json {
        {"args", result.args},
        {"returncode", result.exit_code},
        {"success", result.success},
        {"par2files", par2_files},
        {"stdout", result.out},
        {"stderr", result.err}
    };
}

static nlohmann::json post_to_json(const post_result_t &result) {
    return nlohmann::json {
        {"args", result.args},
        {"returncode", result.exit_code},
        {"success", result.success},
        {"nzb", result.nzb.has_value() ? nlohmann::json(result.nzb->string()) : nlohmann::json(nullptr)},
        {"stdout", result.out},
        {"stderr", result.err}
    };
}

nlohmann::json report_to_json(const run_report_t &report) {
    auto files = nlohmann::json::object();
    for (const auto &f : report.files.items()) {
        auto item = nlohmann::json::object();
        if (f.second.generate.has_value()) {
            item["parpar"] = generate_to_json(f.second.generate.value());
        }
        if (f.second.post.has_value()) {
            item["nyuu"] = post_to_json(f.second.post.value());
        }
        files[f.first.string()] = item;
    }
    auto articles = nlohmann::json::object();
    for (const auto &a : report.articles.items()) {
        articles[a.first.string()] = post_to_json(a.second);
    }
    return nlohmann::json {
        {"status", status_name(report.status)},
        {"message", report.message},
        {"files", files},
        {"articles", articles},
        {"cleared", report.cleared_count}
    };
}

std::optional<std::string> write_report(const run_report_t &report, const std::filesystem::path &path) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return "Failed to create \"" + path.parent_path().string() + "\": " + ec.message();
        }
    }
    std::ofstream stream(path, std::ios::binary | std::ios::trunc);
    if (!stream) {
        return "Could not open \"" + path.string() + "\" for writing";
    }
    stream << report_to_json(report).dump(2) << "\n";
    if (!stream) {
        return "Failed to write \"" + path.string() + "\"";
    }
    return std::nullopt;
}

static void print_output(const std::string &out, const std::string &err) {
    if (!out.empty()) {
        fprintf(stderr, "--- stdout ---\n%s\n", out.c_str());
    }
    if (!err.empty()) {
        fprintf(stderr, "--- stderr ---\n%s\n", err.c_str());
    }
}

void print_summary(const run_report_t &report, bool verbose) {
    if (!report.articles.empty()) {
        fprintf(stdout, "Raw articles:\n");
        for (const auto &a : report.articles.items()) {
            const auto name = a.first.filename().string();
            if (a.second.success) {
                fprintf(stdout, "  OK      %s\n", name.c_str());
                continue;
            }
            fprintf(stdout, "  FAILED  %s (exit code %d)\n", name.c_str(), a.second.exit_code);
            if (verbose) {
                print_output(a.second.out, a.second.err);
            }
        }
    }
    if (!report.files.empty()) {
        fprintf(stdout, "Files:\n");
        for (const auto &f : report.files.items()) {
            const auto name = f.first.filename().string();
            const auto &outcome = f.second;
            if (is_successful(outcome)) {
                if (outcome.post.has_value() && outcome.post->nzb.has_value()) {
                    fprintf(stdout, "  OK      %s -> %s\n", name.c_str(), outcome.post->nzb->string().c_str());
                } else {
                    fprintf(stdout, "  OK      %s\n", name.c_str());
                }
                continue;
            }
            if (outcome.post.has_value()) {
                fprintf(stdout, "  FAILED  %s (nyuu exit code %d)\n", name.c_str(), outcome.post->exit_code);
                if (verbose) {
                    print_output(outcome.post->out, outcome.post->err);
                }
                continue;
            }
            if (outcome.generate.has_value()) {
                fprintf(stdout, "  FAILED  %s (parpar exit code %d)\n", name.c_str(), outcome.generate->exit_code);
                if (verbose) {
                    print_output(outcome.generate->out, outcome.generate->err);
                }
            }
        }
    }
    const auto failures = count_failures(report);
    const auto total = report.files.size() + report.articles.size();
    if (total > 0) {
        fprintf(stdout, "%zu succeeded, %zu failed\n", total - failures, failures);
    }
}
