#include "./path_utils.hpp"

std::filesystem::path path_to_relative(const std::filesystem::path file_name, const std::filesystem::path root) {
    const auto from = std::filesystem::absolute(file_name).lexically_normal();
    const auto base = std::filesystem::absolute(root).lexically_normal();
    auto from_it = from.begin();
    for (auto base_it = base.begin(); base_it != base.end(); base_it++) {
        // trailing separator of a directory
        if (base_it->empty()) {
            continue;
        }
        if (from_it == from.end() || *from_it != *base_it) {
            return file_name;
        }
        from_it++;
    }
    std::filesystem::path relative;
    while (from_it != from.end()) {
        relative /= *from_it;
        from_it++;
    }
    return relative;
}

std::string sanitize_file_name(const std::string &name) {
    auto ret = name;
    for (auto &c : ret) {
        if (c == '`') {
            c = '\'';
        }
    }
    return ret;
}

manifest_name_t make_manifest_name(const std::filesystem::path &file, const std::filesystem::path &root, bool bdmv_naming) {
    auto name = file.filename().string() + ".nzb";
    if (bdmv_naming) {
        const auto parent = path_to_relative(file, root).parent_path().filename().string();
        if (!parent.empty()) {
            name = parent + "_" + name;
        }
    }
    return manifest_name_t { name, sanitize_file_name(name) };
}

std::filesystem::path make_archive_path(
    const std::filesystem::path &output_root,
    const std::string &scope,
    const std::filesystem::path &root,
    const std::filesystem::path &file,
    const std::string &manifest_name) {
    // /data/videos/show/extras/specials/episode.mkv -> extras/specials
    auto subdir = path_to_relative(file, root).parent_path();
    if (subdir.is_absolute()) {
        subdir.clear();
    }
    auto root_name = std::filesystem::absolute(root).lexically_normal().filename();
    if (root_name.empty()) {
        root_name = std::filesystem::absolute(root).lexically_normal().parent_path().filename();
    }
    // ./out/private/show/extras/specials/episode.mkv.nzb
    return output_root / scope / root_name / subdir / manifest_name;
}
