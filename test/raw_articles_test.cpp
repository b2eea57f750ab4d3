#include <filesystem>
#include <gtest/gtest.h>

#include "../src/raw/raw_articles.hpp"
#include "test_utils.hpp"

TEST(raw_articles_test, missing_folder) {
    const auto dir = make_clean_dir("raw_missing");
    const auto config = make_test_config(dir, dir);
    RawArticles raw(dir / "raw", std::make_shared<UsenetPoster>(config));
    EXPECT_TRUE(raw.list_pending().empty());
    EXPECT_EQ(raw.clear_all(), 0);
    EXPECT_TRUE(raw.recover_all(nullptr).empty());
    std::filesystem::remove_all(dir);
}

TEST(raw_articles_test, partial_recovery) {
    const auto dir = make_clean_dir("raw_partial");
    write_file(dir / "raw" / "a1", "raw");
    write_file(dir / "raw" / "a2_fail", "raw");
    write_file(dir / "raw" / "a3", "raw");
    const auto config = make_test_config(dir, dir);
    RawArticles raw(dir / "raw", std::make_shared<UsenetPoster>(config));
    EXPECT_EQ(raw.list_pending().size(), 3);

    size_t started = 0;
    std::vector<std::string> done;
    const auto outcomes = raw.recover_all([&started, &done](const ProgressEvent &event) {
        if (std::holds_alternative<ProgressStageStarted>(event)) {
            EXPECT_EQ(std::get<ProgressStageStarted>(event).stage, PROGRESS_STAGE_RAW);
            started = std::get<ProgressStageStarted>(event).total;
            return;
        }
        done.push_back(std::get<ProgressItemDone>(event).name);
    });
    EXPECT_EQ(started, 3);
    EXPECT_EQ(done, (std::vector<std::string> {"a1", "a2_fail", "a3"}));

    ASSERT_EQ(outcomes.size(), 3);
    EXPECT_TRUE(outcomes.find(dir / "raw" / "a1")->success);
    EXPECT_FALSE(outcomes.find(dir / "raw" / "a2_fail")->success);
    EXPECT_TRUE(outcomes.find(dir / "raw" / "a3")->success);

    // only the failed article is left for the next run
    const auto pending = raw.list_pending();
    ASSERT_EQ(pending.size(), 1);
    EXPECT_EQ(pending[0].filename(), "a2_fail");
    std::filesystem::remove_all(dir);
}

TEST(raw_articles_test, stop_before_next_article) {
    const auto dir = make_clean_dir("raw_stop");
    write_file(dir / "raw" / "a1", "raw");
    write_file(dir / "raw" / "a2", "raw");
    const auto config = make_test_config(dir, dir);
    RawArticles raw(dir / "raw", std::make_shared<UsenetPoster>(config));
    size_t calls = 0;
    const auto outcomes = raw.recover_all(nullptr, [&calls]() {
        return calls++ > 0;
    });
    EXPECT_EQ(outcomes.size(), 1);
    EXPECT_EQ(raw.list_pending().size(), 1);
    std::filesystem::remove_all(dir);
}

TEST(raw_articles_test, clear_all) {
    const auto dir = make_clean_dir("raw_clear");
    write_file(dir / "raw" / "a1", "raw");
    write_file(dir / "raw" / "a2", "raw");
    std::filesystem::create_directories(dir / "raw" / "nested");
    const auto config = make_test_config(dir, dir);
    RawArticles raw(dir / "raw", std::make_shared<UsenetPoster>(config));
    EXPECT_EQ(raw.clear_all(), 2);
    EXPECT_TRUE(raw.list_pending().empty());
    EXPECT_TRUE(std::filesystem::exists(dir / "raw" / "nested"));
    std::filesystem::remove_all(dir);
}
