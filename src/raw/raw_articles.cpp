#include <algorithm>
#include <cstdio>
#include <system_error>

#include "./raw_articles.hpp"

RawArticles::RawArticles(std::filesystem::path dump_path_, std::shared_ptr<UsenetPoster> poster_) :
    dump_path {dump_path_},
    poster {poster_} {}

std::vector<std::filesystem::path> RawArticles::list_pending() const {
    std::vector<std::filesystem::path> ret;
    std::error_code ec;
    if (!std::filesystem::is_directory(dump_path, ec)) {
        return ret;
    }
    for (const auto &entry : std::filesystem::directory_iterator(dump_path, ec)) {
        if (entry.is_regular_file(ec)) {
            ret.push_back(entry.path());
        }
    }
    std::sort(ret.begin(), ret.end());
    return ret;
}

OrderedOutcomes<post_result_t> RawArticles::recover_all(const ProgressObserver &observer, const std::function<bool()> &should_stop) const {
    OrderedOutcomes<post_result_t> ret;
    const auto articles = list_pending();
    if (observer) {
        observer(ProgressStageStarted {PROGRESS_STAGE_RAW, articles.size()});
    }
    for (const auto &article : articles) {
        if (should_stop && should_stop()) {
            break;
        }
        const auto result = poster->repost(article);
        if (result.success) {
            fprintf(stdout, "Reposted %s\n", article.filename().string().c_str());
        } else {
            fprintf(stderr, "Failed to repost %s (exit code %d)\n", article.filename().string().c_str(), result.exit_code);
        }
        ret.insert(article, result);
        if (observer) {
            observer(ProgressItemDone {PROGRESS_STAGE_RAW, article.filename().string(), result.success, false});
        }
    }
    return ret;
}

size_t RawArticles::clear_all() const {
    size_t count = 0;
    for (const auto &article : list_pending()) {
        std::error_code ec;
        if (std::filesystem::remove(article, ec)) {
            count++;
            continue;
        }
        if (ec) {
            fprintf(stderr, "Could not delete \"%s\": %s\n", article.string().c_str(), ec.message().c_str());
        }
    }
    return count;
}
