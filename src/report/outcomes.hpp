#pragma once

#include <vector>
#include <utility>
#include <filesystem>
#include <unordered_map>

// insertion ordered mapping from an item to its outcome.
// Entries can not be replaced once inserted.

template<class T>
class OrderedOutcomes {
  public:
    // returns false if the item already has an outcome
    bool insert(const std::filesystem::path &item, const T &outcome) {
        const auto key = item.string();
        if (index.count(key) > 0) {
            return false;
        }
        index[key] = entries.size();
        entries.emplace_back(item, outcome);
        return true;
    }

    const T *find(const std::filesystem::path &item) const {
        const auto it = index.find(item.string());
        if (it == index.end()) {
            return nullptr;
        }
        return &entries[it->second].second;
    }

    const std::vector<std::pair<std::filesystem::path, T>> &items() const {
        return entries;
    }

    size_t size() const {
        return entries.size();
    }

    bool empty() const {
        return entries.empty();
    }

  private:
    std::vector<std::pair<std::filesystem::path, T>> entries;
    std::unordered_map<std::string, size_t> index;
};
