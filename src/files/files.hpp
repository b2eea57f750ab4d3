#pragma once

#include <string>
#include <vector>
#include <variant>
#include <optional>
#include <filesystem>

#include "../config/config.hpp"

// files below root with one of the extensions (without leading dot, case-insensitive), sorted
std::vector<std::filesystem::path> get_files(const std::filesystem::path &root, const std::vector<std::string> &extensions);

// translates a glob pattern relative to root into a regular expression.
// "*" and "?" do not cross folder boundaries, "**" does
std::string glob_to_regex(const std::string &pattern);

// entries below root matching any of the patterns, sorted.
// a pattern ending with "/" matches only folders
std::vector<std::filesystem::path> get_glob_matches(const std::filesystem::path &root, const std::vector<std::string> &patterns);

// roots of Blu-ray disc structures (folders containing BDMV) inside the folders matching patterns
std::vector<std::filesystem::path> get_bdmv_discs(const std::filesystem::path &root, const std::vector<std::string> &patterns);

// candidate files for a run: the input itself, BDMV discs, glob matches or files by extension
std::vector<std::filesystem::path> discover_files(const run_config_t &config);

// trying to generate par2 files for a par2 file does not work
std::vector<std::filesystem::path> filter_par2_files(const std::vector<std::filesystem::path> &files);

// true for a 0-byte file and for a folder without any non-empty files
bool is_effectively_empty(const std::filesystem::path &path);

// drops empty files and folders and anything that is neither a file nor a folder
std::vector<std::filesystem::path> filter_empty_files(const std::vector<std::filesystem::path> &files);

// moves every file into a folder named after it: dir/ep.mkv -> dir/ep/ep.mkv.
// returns the new locations or an error
std::variant<std::vector<std::filesystem::path>, std::string> move_files(const std::vector<std::filesystem::path> &files);
