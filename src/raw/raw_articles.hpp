#pragma once

#include <vector>
#include <memory>
#include <filesystem>

#include "../nyuu/nyuu.hpp"
#include "../report/outcomes.hpp"
#include "../report/progress.hpp"

// NOTE: RawArticles is not thread-safe

class RawArticles {
public:
    RawArticles(std::filesystem::path dump_path_, std::shared_ptr<UsenetPoster> poster_);

    // files directly inside the dump folder, sorted. The folder is read on every call
    std::vector<std::filesystem::path> list_pending() const;

    // reposts every pending article. A failed article is left in place and does not stop the others.
    // should_stop is checked before each article
    OrderedOutcomes<post_result_t> recover_all(const ProgressObserver &observer, const std::function<bool()> &should_stop = nullptr) const;

    // deletes all pending articles and returns how many were deleted
    size_t clear_all() const;

private:
    const std::filesystem::path dump_path;
    std::shared_ptr<UsenetPoster> poster;
};
