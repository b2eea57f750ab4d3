#include <filesystem>
#include <gtest/gtest.h>

#include "../src/nyuu/nyuu.hpp"
#include "test_utils.hpp"

TEST(nyuu_test, success_exit_codes) {
    EXPECT_TRUE(is_success_exit_code(0));
    EXPECT_TRUE(is_success_exit_code(NYUU_EXIT_CODE_WARNING));
    EXPECT_FALSE(is_success_exit_code(1));
    EXPECT_FALSE(is_success_exit_code(-1));
}

TEST(nyuu_test, post_archives_manifest) {
    const auto dir = make_clean_dir("nyuu_post");
    write_file(dir / "Show" / "Extras" / "ep.mkv", "data");
    write_file(dir / "work" / "ep.mkv.par2", "index");
    write_file(dir / "work" / "ep.mkv.vol00+01.par2", "recovery");
    const auto config = make_test_config(dir / "Show", dir);
    UsenetPoster poster(config);
    const auto par2_files = std::vector<std::filesystem::path> {dir / "work" / "ep.mkv.par2", dir / "work" / "ep.mkv.vol00+01.par2"};
    const auto result = poster.post(dir / "Show" / "Extras" / "ep.mkv", par2_files, post_options_t {false, true, dir / "work"});
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.exit_code, 0);
    ASSERT_TRUE(result.nzb.has_value());
    EXPECT_EQ(result.nzb.value(), dir / "nzbs" / "private" / "Show" / "Extras" / "ep.mkv.nzb");
    EXPECT_TRUE(std::filesystem::exists(result.nzb.value()));
    EXPECT_FALSE(std::filesystem::exists(dir / "work" / "ep.mkv.nzb"));
    // par2 files are deleted after a successful post
    EXPECT_FALSE(std::filesystem::exists(par2_files[0]));
    EXPECT_FALSE(std::filesystem::exists(par2_files[1]));

    ASSERT_GE(result.args.size(), 6);
    EXPECT_EQ(result.args[1], "--config");
    EXPECT_EQ(result.args[3], "--out");
    EXPECT_EQ(result.args[4], "ep.mkv.nzb");
    EXPECT_EQ(result.args[5], (dir / "Show" / "Extras" / "ep.mkv").string());
    std::filesystem::remove_all(dir);
}

TEST(nyuu_test, warning_is_success) {
    const auto dir = make_clean_dir("nyuu_warning");
    write_file(dir / "Show" / "warn.mkv", "data");
    write_file(dir / "Show" / "warn.mkv.par2", "index");
    write_file(dir / "Show" / "warn.mkv.vol00+01.par2", "recovery");
    const auto config = make_test_config(dir / "Show", dir);
    UsenetPoster poster(config);
    const auto par2_files = std::vector<std::filesystem::path> {dir / "Show" / "warn.mkv.par2", dir / "Show" / "warn.mkv.vol00+01.par2"};
    const auto result = poster.post(dir / "Show" / "warn.mkv", par2_files, post_options_t {});
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.exit_code, NYUU_EXIT_CODE_WARNING);
    ASSERT_TRUE(result.nzb.has_value());
    EXPECT_EQ(result.nzb.value(), dir / "nzbs" / "private" / "Show" / "warn.mkv.nzb");
    EXPECT_TRUE(std::filesystem::exists(result.nzb.value()));
    EXPECT_FALSE(std::filesystem::exists(par2_files[0]));
    EXPECT_FALSE(std::filesystem::exists(par2_files[1]));
    std::filesystem::remove_all(dir);
}

TEST(nyuu_test, keep_par2_files) {
    const auto dir = make_clean_dir("nyuu_keep_par2");
    write_file(dir / "Show" / "ep.mkv", "data");
    write_file(dir / "work" / "ep.mkv.par2", "index");
    write_file(dir / "work" / "ep.mkv.vol00+01.par2", "recovery");
    const auto config = make_test_config(dir / "Show", dir);
    UsenetPoster poster(config);
    const auto par2_files = std::vector<std::filesystem::path> {dir / "work" / "ep.mkv.par2", dir / "work" / "ep.mkv.vol00+01.par2"};
    const auto result = poster.post(dir / "Show" / "ep.mkv", par2_files, post_options_t {false, false, dir / "work"});
    EXPECT_TRUE(result.success);
    ASSERT_TRUE(result.nzb.has_value());
    EXPECT_TRUE(std::filesystem::exists(result.nzb.value()));
    EXPECT_TRUE(std::filesystem::exists(par2_files[0]));
    EXPECT_TRUE(std::filesystem::exists(par2_files[1]));
    std::filesystem::remove_all(dir);
}

TEST(nyuu_test, failure_keeps_par2_files) {
    const auto dir = make_clean_dir("nyuu_failure");
    write_file(dir / "Show" / "fail.mkv", "data");
    write_file(dir / "Show" / "fail.mkv.par2", "index");
    const auto config = make_test_config(dir / "Show", dir);
    UsenetPoster poster(config);
    const auto result = poster.post(dir / "Show" / "fail.mkv", {dir / "Show" / "fail.mkv.par2"}, post_options_t {});
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_FALSE(result.nzb.has_value());
    EXPECT_FALSE(result.err.empty());
    EXPECT_TRUE(std::filesystem::exists(dir / "Show" / "fail.mkv.par2"));
    EXPECT_FALSE(std::filesystem::exists(dir / "nzbs"));
    std::filesystem::remove_all(dir);
}

TEST(nyuu_test, missing_manifest_is_failure) {
    const auto dir = make_clean_dir("nyuu_missing_manifest");
    write_file(dir / "Show" / "nonzb.mkv", "data");
    const auto config = make_test_config(dir / "Show", dir);
    UsenetPoster poster(config);
    const auto result = poster.post(dir / "Show" / "nonzb.mkv", {}, post_options_t {});
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_FALSE(result.success);
    EXPECT_FALSE(result.nzb.has_value());
    std::filesystem::remove_all(dir);
}

TEST(nyuu_test, backtick_in_name) {
    const auto dir = make_clean_dir("nyuu_backtick");
    write_file(dir / "Show" / "it`s.mkv", "data");
    const auto config = make_test_config(dir / "Show", dir);
    UsenetPoster poster(config);
    const auto result = poster.post(dir / "Show" / "it`s.mkv", {}, post_options_t {});
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.args[4], "it's.mkv.nzb");
    ASSERT_TRUE(result.nzb.has_value());
    EXPECT_EQ(result.nzb->filename(), "it`s.mkv.nzb");
    std::filesystem::remove_all(dir);
}

TEST(nyuu_test, bdmv_naming) {
    const auto dir = make_clean_dir("nyuu_bdmv");
    write_file(dir / "discs" / "Movie" / "DISC1" / "BDMV" / "index.bdmv", "data");
    auto config = make_test_config(dir / "discs", dir);
    config.bdmv = true;
    UsenetPoster poster(config);
    const auto result = poster.post(dir / "discs" / "Movie" / "DISC1", {}, post_options_t {true, true, std::nullopt});
    EXPECT_TRUE(result.success);
    ASSERT_TRUE(result.nzb.has_value());
    EXPECT_EQ(result.nzb.value(), dir / "nzbs" / "private" / "discs" / "Movie" / "Movie_DISC1.nzb");
    std::filesystem::remove_all(dir);
}

TEST(nyuu_test, repost) {
    const auto dir = make_clean_dir("nyuu_repost");
    write_file(dir / "raw" / "article1", "raw");
    write_file(dir / "raw" / "article_fail", "raw");
    const auto config = make_test_config(dir, dir);
    UsenetPoster poster(config);
    auto result = poster.repost(dir / "raw" / "article1");
    EXPECT_TRUE(result.success);
    EXPECT_FALSE(result.nzb.has_value());
    EXPECT_FALSE(std::filesystem::exists(dir / "raw" / "article1"));
    const std::vector<std::string> expected_tail {"--delete-raw-posts", "--input-raw-posts", (dir / "raw" / "article1").string()};
    EXPECT_EQ(std::vector<std::string>(result.args.end() - 3, result.args.end()), expected_tail);

    result = poster.repost(dir / "raw" / "article_fail");
    EXPECT_FALSE(result.success);
    EXPECT_TRUE(std::filesystem::exists(dir / "raw" / "article_fail"));
    std::filesystem::remove_all(dir);
}
