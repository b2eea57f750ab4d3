#include <algorithm>
#include <cctype>
#include <regex>
#include <set>
#include <system_error>

#include "../parpar/parpar.hpp"
#include "../path/path_utils.hpp"

#include "./files.hpp"

#define BDMV_FOLDER_NAME "BDMV"
#define DEFAULT_BDMV_GLOB "*/"

static std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return std::tolower(c); });
    return value;
}

static std::vector<std::filesystem::path> sorted_unique(const std::vector<std::filesystem::path> &files) {
    std::set<std::filesystem::path> unique(files.begin(), files.end());
    return std::vector<std::filesystem::path>(unique.begin(), unique.end());
}

std::vector<std::filesystem::path> get_files(const std::filesystem::path &root, const std::vector<std::string> &extensions) {
    std::set<std::string> wanted;
    for (const auto &e : extensions) {
        auto ext = to_lower(e);
        if (!ext.empty() && ext[0] == '.') {
            ext = ext.substr(1);
        }
        wanted.insert(ext);
    }
    std::vector<std::filesystem::path> ret;
    std::error_code ec;
    for (auto it = std::filesystem::recursive_directory_iterator(root, std::filesystem::directory_options::skip_permission_denied, ec);
         it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            break;
        }
        if (!it->is_regular_file(ec)) {
            continue;
        }
        auto ext = to_lower(it->path().extension().string());
        if (!ext.empty()) {
            ext = ext.substr(1);
        }
        if (wanted.count(ext) > 0) {
            ret.push_back(it->path().lexically_normal());
        }
    }
    return sorted_unique(ret);
}

std::string glob_to_regex(const std::string &pattern) {
    std::string regex;
    for (size_t i = 0; i < pattern.size(); i++) {
        const auto c = pattern[i];
        if (c == '*') {
            if (i + 1 < pattern.size() && pattern[i + 1] == '*') {
                // "**/" also matches no folder at all
                if (i + 2 < pattern.size() && pattern[i + 2] == '/') {
                    regex += "(?:.*/)?";
                    i += 2;
                } else {
                    regex += ".*";
                    i += 1;
                }
                continue;
            }
            regex += "[^/]*";
            continue;
        }
        if (c == '?') {
            regex += "[^/]";
            continue;
        }
        if (c == '[') {
            const auto close = pattern.find(']', i + 1);
            if (close != std::string::npos) {
                auto set = pattern.substr(i + 1, close - i - 1);
                if (!set.empty() && set[0] == '!') {
                    set[0] = '^';
                }
                regex += "[" + set + "]";
                i = close;
                continue;
            }
        }
        if (std::string(".^$|()+{}\\[]").find(c) != std::string::npos) {
            regex += '\\';
        }
        regex += c;
    }
    return regex;
}

std::vector<std::filesystem::path> get_glob_matches(const std::filesystem::path &root, const std::vector<std::string> &patterns) {
    struct matcher_t {
        std::regex regex;
        bool only_folders;
    };
    std::vector<matcher_t> matchers;
    for (auto p : patterns) {
        auto only_folders = false;
        while (!p.empty() && p.back() == '/') {
            p.pop_back();
            only_folders = true;
        }
        if (p.empty()) {
            continue;
        }
        matchers.push_back(matcher_t {std::regex(glob_to_regex(p)), only_folders});
    }

    std::vector<std::filesystem::path> ret;
    std::error_code ec;
    for (auto it = std::filesystem::recursive_directory_iterator(root, std::filesystem::directory_options::skip_permission_denied, ec);
         it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            break;
        }
        const auto relative = path_to_relative(it->path(), root).generic_string();
        const auto is_folder = it->is_directory(ec);
        for (const auto &m : matchers) {
            if (m.only_folders && !is_folder) {
                continue;
            }
            if (std::regex_match(relative, m.regex)) {
                ret.push_back(it->path().lexically_normal());
                break;
            }
        }
    }
    return sorted_unique(ret);
}

std::vector<std::filesystem::path> get_bdmv_discs(const std::filesystem::path &root, const std::vector<std::string> &patterns) {
    std::vector<std::filesystem::path> ret;
    for (const auto &folder : get_glob_matches(root, patterns.empty() ? std::vector<std::string> {DEFAULT_BDMV_GLOB} : patterns)) {
        std::error_code ec;
        if (!std::filesystem::is_directory(folder, ec)) {
            continue;
        }
        if (std::filesystem::is_directory(folder / BDMV_FOLDER_NAME, ec)) {
            ret.push_back(folder);
            continue;
        }
        for (auto it = std::filesystem::recursive_directory_iterator(folder, std::filesystem::directory_options::skip_permission_denied, ec);
             it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
            if (ec) {
                break;
            }
            if (it->is_directory(ec) && it->path().filename() == BDMV_FOLDER_NAME) {
                ret.push_back(it->path().parent_path().lexically_normal());
                // contents of a disc are not searched for more discs
                it.disable_recursion_pending();
            }
        }
    }
    return sorted_unique(ret);
}

std::vector<std::filesystem::path> discover_files(const run_config_t &config) {
    std::error_code ec;
    if (std::filesystem::is_regular_file(config.input, ec)) {
        return {config.input};
    }
    if (config.bdmv) {
        return get_bdmv_discs(config.input, config.glob);
    }
    if (!config.glob.empty()) {
        return get_glob_matches(config.input, config.glob);
    }
    return get_files(config.input, config.extensions);
}

std::vector<std::filesystem::path> filter_par2_files(const std::vector<std::filesystem::path> &files) {
    std::vector<std::filesystem::path> ret;
    std::copy_if(files.begin(), files.end(), std::back_inserter(ret), [](const auto &f) {
        return !is_par2_file(f);
    });
    return ret;
}

bool is_effectively_empty(const std::filesystem::path &path) {
    std::error_code ec;
    if (std::filesystem::is_regular_file(path, ec)) {
        return std::filesystem::file_size(path, ec) == 0 || ec;
    }
    if (!std::filesystem::is_directory(path, ec)) {
        return true;
    }
    for (auto it = std::filesystem::recursive_directory_iterator(path, std::filesystem::directory_options::skip_permission_denied, ec);
         it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            break;
        }
        std::error_code size_ec;
        if (it->is_regular_file(size_ec) && it->file_size(size_ec) > 0 && !size_ec) {
            return false;
        }
    }
    return true;
}

std::vector<std::filesystem::path> filter_empty_files(const std::vector<std::filesystem::path> &files) {
    std::vector<std::filesystem::path> ret;
    std::copy_if(files.begin(), files.end(), std::back_inserter(ret), [](const auto &f) {
        return !is_effectively_empty(f);
    });
    return ret;
}

std::variant<std::vector<std::filesystem::path>, std::string> move_files(const std::vector<std::filesystem::path> &files) {
    std::vector<std::filesystem::path> moved;
    for (const auto &f : files) {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(f, ec)) {
            continue;
        }
        const auto folder = f.parent_path() / f.stem();
        std::filesystem::create_directories(folder, ec);
        if (ec) {
            return "Failed to create \"" + folder.string() + "\": " + ec.message();
        }
        const auto destination = folder / f.filename();
        std::filesystem::rename(f, destination, ec);
        if (ec) {
            return "Failed to move \"" + f.string() + "\": " + ec.message();
        }
        moved.push_back(destination);
    }
    return moved;
}
