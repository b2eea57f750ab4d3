#pragma once

#include <string>
#include <filesystem>

// convert absolute path to relative by stripping root folder.
// If file_name is not in root folder, return file_name
std::filesystem::path path_to_relative(const std::filesystem::path file_name, const std::filesystem::path root);

// the poster can not parse backticks in its arguments
std::string sanitize_file_name(const std::string &name);

struct manifest_name_t {
    // name of the archived manifest
    std::string name;
    // name the poster writes to, see sanitize_file_name
    std::string working_name;
};

// "<file name>.nzb". With bdmv_naming the name is prefixed with "<parent folder>_"
// when the file is not directly inside root
manifest_name_t make_manifest_name(const std::filesystem::path &file, const std::filesystem::path &root, bool bdmv_naming);

// <output_root>/<scope>/<root name>/<subdirectory of file under root>/<manifest_name>
// a root which is the file itself has no subdirectory
std::filesystem::path make_archive_path(
    const std::filesystem::path &output_root,
    const std::string &scope,
    const std::filesystem::path &root,
    const std::filesystem::path &file,
    const std::string &manifest_name);
