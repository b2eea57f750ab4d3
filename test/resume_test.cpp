#include <filesystem>
#include <gtest/gtest.h>

#include "../src/db/sqlite.hpp"
#include "../src/resume/resume.hpp"
#include "test_utils.hpp"

TEST(resume_test, basic_check) {
    const auto maybe_db = db_open(":memory:");
    const auto db = std::get<std::shared_ptr<sqlite3>>(maybe_db);
    ResumeLedger ledger(db);
    EXPECT_FALSE(ledger.is_disabled());
    EXPECT_EQ(ledger.count(UPLOAD_SCOPE_PRIVATE), 0);
    EXPECT_FALSE(ledger.is_recorded(UPLOAD_SCOPE_PRIVATE, "/data/show/ep1.mkv"));
    ledger.record(UPLOAD_SCOPE_PRIVATE, "/data/show/ep1.mkv");
    EXPECT_TRUE(ledger.is_recorded(UPLOAD_SCOPE_PRIVATE, "/data/show/ep1.mkv"));
    EXPECT_EQ(ledger.count(UPLOAD_SCOPE_PRIVATE), 1);
}

TEST(resume_test, record_is_idempotent) {
    const auto maybe_db = db_open(":memory:");
    const auto db = std::get<std::shared_ptr<sqlite3>>(maybe_db);
    ResumeLedger ledger(db);
    ledger.record(UPLOAD_SCOPE_PRIVATE, "/data/show/ep1.mkv");
    ledger.record(UPLOAD_SCOPE_PRIVATE, "/data/show/ep1.mkv");
    // same file written differently
    ledger.record(UPLOAD_SCOPE_PRIVATE, "/data/show/extras/../ep1.mkv");
    EXPECT_EQ(ledger.count(UPLOAD_SCOPE_PRIVATE), 1);
}

TEST(resume_test, scopes_are_independent) {
    const auto maybe_db = db_open(":memory:");
    const auto db = std::get<std::shared_ptr<sqlite3>>(maybe_db);
    ResumeLedger ledger(db);
    ledger.record(UPLOAD_SCOPE_PRIVATE, "/data/show/ep1.mkv");
    EXPECT_TRUE(ledger.is_recorded(UPLOAD_SCOPE_PRIVATE, "/data/show/ep1.mkv"));
    EXPECT_FALSE(ledger.is_recorded(UPLOAD_SCOPE_PUBLIC, "/data/show/ep1.mkv"));
    EXPECT_EQ(ledger.count(UPLOAD_SCOPE_PUBLIC), 0);
}

TEST(resume_test, filter_unrecorded_keeps_order) {
    const auto maybe_db = db_open(":memory:");
    const auto db = std::get<std::shared_ptr<sqlite3>>(maybe_db);
    ResumeLedger ledger(db);
    ledger.record(UPLOAD_SCOPE_PRIVATE, "/data/b.mkv");
    const auto files = ledger.filter_unrecorded(UPLOAD_SCOPE_PRIVATE, {"/data/c.mkv", "/data/b.mkv", "/data/a.mkv"});
    ASSERT_EQ(files.size(), 2);
    EXPECT_EQ(files[0], "/data/c.mkv");
    EXPECT_EQ(files[1], "/data/a.mkv");
}

TEST(resume_test, clear) {
    const auto maybe_db = db_open(":memory:");
    const auto db = std::get<std::shared_ptr<sqlite3>>(maybe_db);
    ResumeLedger ledger(db);
    ledger.record(UPLOAD_SCOPE_PRIVATE, "/data/a.mkv");
    ledger.record(UPLOAD_SCOPE_PUBLIC, "/data/a.mkv");
    ledger.clear(UPLOAD_SCOPE_PUBLIC);
    EXPECT_EQ(ledger.count(UPLOAD_SCOPE_PUBLIC), 0);
    EXPECT_EQ(ledger.count(UPLOAD_SCOPE_PRIVATE), 1);
    ledger.record(UPLOAD_SCOPE_PUBLIC, "/data/a.mkv");
    ledger.clear();
    EXPECT_EQ(ledger.count(UPLOAD_SCOPE_PUBLIC), 0);
    EXPECT_EQ(ledger.count(UPLOAD_SCOPE_PRIVATE), 0);
}

TEST(resume_test, disabled_ledger) {
    const auto maybe_db = db_open(":memory:");
    const auto db = std::get<std::shared_ptr<sqlite3>>(maybe_db);
    ResumeLedger(db).record(UPLOAD_SCOPE_PRIVATE, "/data/a.mkv");
    ResumeLedger ledger(db, true);
    EXPECT_TRUE(ledger.is_disabled());
    EXPECT_FALSE(ledger.is_recorded(UPLOAD_SCOPE_PRIVATE, "/data/a.mkv"));
    EXPECT_EQ(ledger.filter_unrecorded(UPLOAD_SCOPE_PRIVATE, {"/data/a.mkv"}).size(), 1);
    ledger.record(UPLOAD_SCOPE_PRIVATE, "/data/b.mkv");
    EXPECT_EQ(ledger.count(UPLOAD_SCOPE_PRIVATE), 1);
}

TEST(resume_test, survives_reopen) {
    const auto dir = make_clean_dir("resume_reopen");
    const auto resume_file = dir / "appdata" / "resume.sqlite";
    {
        const auto maybe_db = db_open(resume_file.string());
        ASSERT_TRUE(std::holds_alternative<std::shared_ptr<sqlite3>>(maybe_db));
        ResumeLedger ledger(std::get<std::shared_ptr<sqlite3>>(maybe_db));
        ledger.record(UPLOAD_SCOPE_PRIVATE, "/data/a.mkv");
    }
    EXPECT_TRUE(std::filesystem::exists(resume_file));
    const auto maybe_db = db_open(resume_file.string());
    ResumeLedger ledger(std::get<std::shared_ptr<sqlite3>>(maybe_db));
    EXPECT_TRUE(ledger.is_recorded(UPLOAD_SCOPE_PRIVATE, "/data/a.mkv"));
    std::filesystem::remove_all(dir);
}
