#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>

#define PROCESS_START_FAILED_EXIT_CODE -1

struct process_result_t {
    std::vector<std::string> args;
    int exit_code;
    std::string out;
    std::string err;
};

// runs a program and blocks until it exits. No timeout is applied.
// output is always captured; with echo_output it is also forwarded to our stdout/stderr as it arrives.
// a program which could not be started is reported with PROCESS_START_FAILED_EXIT_CODE
process_result_t run_process(const std::vector<std::string> &args, const std::optional<std::filesystem::path> &cwd, bool echo_output);

// shell-like rendering of a command line for logs
std::string join_command_line(const std::vector<std::string> &args);
