#include <filesystem>
#include <gtest/gtest.h>

#include "../src/path/path_utils.hpp"
#include "test_utils.hpp"

TEST(path_utils_test, relative) {
    EXPECT_EQ(path_to_relative("/data/show/extras/ep.mkv", "/data/show"), "extras/ep.mkv");
    EXPECT_EQ(path_to_relative("/data/show/extras/ep.mkv", "/data/show/"), "extras/ep.mkv");
    EXPECT_EQ(path_to_relative("/other/ep.mkv", "/data/show"), "/other/ep.mkv");
}

TEST(path_utils_test, sanitize) {
    EXPECT_EQ(sanitize_file_name("It`s.mkv.nzb"), "It's.mkv.nzb");
    EXPECT_EQ(sanitize_file_name("plain.mkv"), "plain.mkv");
}

TEST(path_utils_test, manifest_name) {
    auto name = make_manifest_name("/data/show/ep`1.mkv", "/data/show", false);
    EXPECT_EQ(name.name, "ep`1.mkv.nzb");
    EXPECT_EQ(name.working_name, "ep'1.mkv.nzb");

    name = make_manifest_name("/data/discs/Movie/DISC1", "/data/discs", true);
    EXPECT_EQ(name.name, "Movie_DISC1.nzb");
    // directly inside root there is no parent to prefix
    name = make_manifest_name("/data/discs/DISC1", "/data/discs", true);
    EXPECT_EQ(name.name, "DISC1.nzb");
}

TEST(path_utils_test, archive_path) {
    EXPECT_EQ(make_archive_path("/out", "private", "/data/Show", "/data/Show/Extras/ep.mkv", "ep.mkv.nzb"),
        std::filesystem::path("/out/private/Show/Extras/ep.mkv.nzb"));
    EXPECT_EQ(make_archive_path("/out", "public", "/data/Show/", "/data/Show/ep.mkv", "ep.mkv.nzb"),
        std::filesystem::path("/out/public/Show/ep.mkv.nzb"));
    // input is the file itself
    EXPECT_EQ(make_archive_path("/out", "private", "/data/Show/ep.mkv", "/data/Show/ep.mkv", "ep.mkv.nzb"),
        std::filesystem::path("/out/private/ep.mkv/ep.mkv.nzb"));
}
