#include <cstdio>

#include <process.hpp>

#include "./process.hpp"

process_result_t run_process(const std::vector<std::string> &args, const std::optional<std::filesystem::path> &cwd, bool echo_output) {
    process_result_t result {args, PROCESS_START_FAILED_EXIT_CODE, "", ""};
    if (args.empty()) {
        result.err = "Empty command line";
        return result;
    }

    const auto path = cwd.has_value() ? cwd.value().string() : std::string();
    TinyProcessLib::Process process(
        args,
        path,
        [&result, echo_output](const char *bytes, size_t n) {
            result.out.append(bytes, n);
            if (echo_output) {
                fwrite(bytes, 1, n, stdout);
                fflush(stdout);
            }
        },
        [&result, echo_output](const char *bytes, size_t n) {
            result.err.append(bytes, n);
            if (echo_output) {
                fwrite(bytes, 1, n, stderr);
                fflush(stderr);
            }
        }
    );

    if (process.get_id() <= 0) {
        result.err = "Failed to start \"" + args[0] + "\"";
        return result;
    }
    // waits for the process and its output readers to finish
    result.exit_code = process.get_exit_status();
    return result;
}

static std::string quote_argument(const std::string &arg) {
    if (!arg.empty() && arg.find_first_of(" \t\n'\"\\$`*?[]()&;|<>!#~") == std::string::npos) {
        return arg;
    }
    std::string quoted = "'";
    for (const auto c : arg) {
        if (c == '\'') {
            quoted += "'\"'\"'";
            continue;
        }
        quoted += c;
    }
    quoted += "'";
    return quoted;
}

std::string join_command_line(const std::vector<std::string> &args) {
    std::string line;
    for (const auto &a : args) {
        if (!line.empty()) {
            line += " ";
        }
        line += quote_argument(a);
    }
    return line;
}
