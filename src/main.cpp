#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <stdexcept>

#include <cxxopts.hpp>
#include <sqlite3.h>

#include "./config/config.hpp"
#include "./db/sqlite.hpp"
#include "./resume/resume.hpp"
#include "./parpar/parpar.hpp"
#include "./nyuu/nyuu.hpp"
#include "./raw/raw_articles.hpp"
#include "./report/report.hpp"
#include "./pipeline/pipeline.hpp"

#define STRING(x) #x
#define XSTRING(x) STRING(x)

#define APP_NAME XSTRING(CMAKE_PROJECT_NAME)
#define APP_VERSION XSTRING(CMAKE_PROJECT_VERSION)

#define EXIT_INTERRUPTED 130

static volatile std::sig_atomic_t interrupted = 0;

static void on_interrupt(int) {
    interrupted = 1;
}

static void print_usage(const cxxopts::Options &options) {
    fprintf(stderr, "%s", options.help().c_str());
}

static ProgressObserver make_progress_printer() {
    return [](const ProgressEvent &event) {
        if (std::holds_alternative<ProgressStageStarted>(event)) {
            return;
        }
        const auto &item = std::get<ProgressItemDone>(event);
        if (item.skipped) {
            return;
        }
        fprintf(stdout, "[%s] %s %s\n", stage_name(item.stage), item.success ? "done" : "failed", item.name.c_str());
    };
}

int main(int argc, char const* argv[]) {
    cxxopts::Options options(APP_NAME, "Generate par2 files and post them to Usenet, keeping track of uploaded files");

    options.add_options()
           ("path", "File or folder to upload", cxxopts::value<std::string>())
           ("c,config", std::string("Path to JSON config file. Default is ./") + DEFAULT_CONFIG_FILE_NAME, cxxopts::value<std::string>())
           ("p,public", "Use the public Nyuu config")
           ("only-generate", "Only generate par2 files next to the input files")
           ("only-post", "Only post files with pre-existing par2 files")
           ("only-raw", "Only repost raw articles")
           ("skip-raw", "Skip reposting raw articles")
           ("clear-raw", "Delete all raw articles")
           ("only-move", "Only move every file into a folder of its own")
           ("clear-resume", "Delete resume data")
           ("m,move", "Move every file into a folder of its own before uploading")
           ("no-resume", "Ignore resume data and upload everything")
           ("b,bdmv", "Upload BDMV disc folders")
           ("g,glob", "Glob pattern relative to the input path, can be repeated", cxxopts::value<std::vector<std::string>>())
           ("e,exts", "File extensions to upload, overrides the config", cxxopts::value<std::vector<std::string>>())
           ("resume-file", "Path to resume data. Default is <appdata>/" RESUME_STORAGE_NAME, cxxopts::value<std::string>())
           ("r,report", "Write the run report as JSON to this file", cxxopts::value<std::string>())
           ("d,debug", "Show external commands and their output")
           ("v,version", "Show version")
           ("h,help", "Show help");
    options.parse_positional({"path"});
    options.positional_help("<path>");

    cxxopts::ParseResult args;

    try {
        args = options.parse(argc, argv);
    } catch (const cxxopts::exceptions::exception &x) {
        fprintf(stderr, "%s: %s\n", APP_NAME, x.what());
        print_usage(options);
        return EXIT_FAILURE;
    }

    if (args.count("help")) {
        print_usage(options);
        return EXIT_SUCCESS;
    }

    if (args.count("version")) {
        fprintf(stderr, "%s: %s\n", APP_NAME, APP_VERSION);
        return EXIT_SUCCESS;
    }

    if (!args.count("path")) {
        fprintf(stderr, "Input path is not set.\n");
        print_usage(options);
        return EXIT_FAILURE;
    }

    run_options_t run_options;
    run_options.input = args["path"].as<std::string>();
    run_options.scope = args.count("public") ? UPLOAD_SCOPE_PUBLIC : UPLOAD_SCOPE_PRIVATE;
    run_options.mode_flags.only_generate = args.count("only-generate") > 0;
    run_options.mode_flags.only_post = args.count("only-post") > 0;
    run_options.mode_flags.only_raw = args.count("only-raw") > 0;
    run_options.mode_flags.skip_raw = args.count("skip-raw") > 0;
    run_options.mode_flags.clear_raw = args.count("clear-raw") > 0;
    run_options.mode_flags.only_move = args.count("only-move") > 0;
    run_options.mode_flags.clear_resume = args.count("clear-resume") > 0;
    run_options.move = args.count("move") > 0;
    run_options.no_resume = args.count("no-resume") > 0;
    run_options.bdmv = args.count("bdmv") > 0;
    run_options.debug = args.count("debug") > 0;
    if (args.count("glob")) {
        run_options.glob = args["glob"].as<std::vector<std::string>>();
    }
    if (args.count("exts")) {
        run_options.extensions = args["exts"].as<std::vector<std::string>>();
    }
    if (args.count("resume-file")) {
        run_options.resume_file = std::filesystem::path(args["resume-file"].as<std::string>());
    }

    // mutually exclusive options are rejected before the config is even read
    const auto mode_ret = resolve_run_mode(run_options.mode_flags);
    if (std::holds_alternative<std::string>(mode_ret)) {
        fprintf(stderr, "%s\n", std::get<std::string>(mode_ret).c_str());
        return EXIT_FAILURE;
    }

    std::string config_path = DEFAULT_CONFIG_FILE_NAME;
    if (args.count("config")) {
        config_path = args["config"].as<std::string>();
    }
    const auto app_config_ret = load_app_config(config_path);
    if (std::holds_alternative<std::string>(app_config_ret)) {
        fprintf(stderr, "Failed to load config: %s\n", std::get<std::string>(app_config_ret).c_str());
        return EXIT_FAILURE;
    }
    const auto &app_config = std::get<app_config_t>(app_config_ret);

    const auto config_ret = make_run_config(app_config, run_options);
    if (std::holds_alternative<std::string>(config_ret)) {
        fprintf(stderr, "Invalid configuration: %s\n", std::get<std::string>(config_ret).c_str());
        return EXIT_FAILURE;
    }
    const auto &config = std::get<run_config_t>(config_ret);

    fprintf(stdout, "Config: %s\n", config_path.c_str());
    fprintf(stdout, "ParPar: %s\n", config.parpar_bin.string().c_str());
    fprintf(stdout, "Nyuu: %s\n", config.nyuu_bin.string().c_str());
    fprintf(stdout, "Nyuu Config: %s\n", config.nyuu_config.string().c_str());
    fprintf(stdout, "NZB Output: %s\n", config.nzb_output_path.string().c_str());
    fprintf(stdout, "Raw Articles: %s\n", config.raw_dump_path.string().c_str());
    fprintf(stdout, "Resume Data: %s\n", config.resume_file.string().c_str());
    fprintf(stdout, "Working Directory: %s\n", config.work_dir.value_or(config.input).string().c_str());
    fprintf(stdout, "Scope: %s, mode: %s\n", scope_name(config.scope).c_str(), mode_name(config.mode).c_str());

    std::signal(SIGINT, on_interrupt);
    std::signal(SIGTERM, on_interrupt);

    const auto db_open_ret = db_open(config.resume_file.string());
    if (std::holds_alternative<std::string>(db_open_ret)) {
        fprintf(stderr, "Failed to open resume data: %s\n", std::get<std::string>(db_open_ret).c_str());
        return EXIT_FAILURE;
    }
    const auto db = std::get<std::shared_ptr<sqlite3>>(db_open_ret);

    std::variant<run_report_t, std::string> run_ret;
    try {
        auto ledger = std::make_shared<ResumeLedger>(db, config.no_resume);
        auto generator = std::make_shared<Par2Generator>(config);
        auto poster = std::make_shared<UsenetPoster>(config);
        auto raw_articles = std::make_shared<RawArticles>(config.raw_dump_path, poster);
        UploadPipeline pipeline(
            config,
            ledger,
            generator,
            poster,
            raw_articles,
            make_progress_printer(),
            [] { return interrupted != 0; }
        );
        run_ret = pipeline.run();
    } catch (const std::runtime_error &e) {
        fprintf(stderr, "Fatal error: %s\n", e.what());
        return EXIT_FAILURE;
    }

    if (std::holds_alternative<std::string>(run_ret)) {
        fprintf(stderr, "Could not complete the run. Error:\n%s\n", std::get<std::string>(run_ret).c_str());
        return EXIT_FAILURE;
    }
    const auto &report = std::get<run_report_t>(run_ret);

    print_summary(report, config.debug);

    if (args.count("report")) {
        const auto report_path = args["report"].as<std::string>();
        const auto write_ret = write_report(report, report_path);
        if (write_ret.has_value()) {
            fprintf(stderr, "Failed to write report: %s\n", write_ret.value().c_str());
            return EXIT_FAILURE;
        }
    }

    if (report.status == RUN_STATUS_CANCELLED || interrupted) {
        return EXIT_INTERRUPTED;
    }
    return count_failures(report) > 0 ? EXIT_FAILURE : EXIT_SUCCESS;
}
