#include <gtest/gtest.h>
#include <server/static_lookup.hpp>
#include "scratch_dir.hpp"

class StaticLookupTest : public ScratchDirTest {
protected:
    std::vector<fs::path> search;

    void SetUp() override {
        ScratchDirTest::SetUp();
        write_file("custom/static/theme.css", "custom");
        write_file("default/static/theme.css", "default");
        write_file("default/static/main.js", "js");
        write_file("default/static/docs/index.html", "docs");
        write_file("outside.txt", "secret");
        search = {test_dir / "custom/static", test_dir / "missing/static", test_dir / "default/static"};
    }
};

TEST_F(StaticLookupTest, FirstDirectoryWins) {
    auto hit = find_static_file(search, "theme.css", "index.html");
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(*hit, (test_dir / "custom/static/theme.css").lexically_normal());
}

TEST_F(StaticLookupTest, FallsThroughToLaterDirectory) {
    auto hit = find_static_file(search, "main.js", "index.html");
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(*hit, (test_dir / "default/static/main.js").lexically_normal());
}

TEST_F(StaticLookupTest, DirectoryRequestGetsDefaultFilename) {
    auto hit = find_static_file(search, "docs/", "index.html");
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(hit->filename(), "index.html");

    auto bare = find_static_file(search, "docs", "index.html");
    ASSERT_TRUE(bare.has_value());
    EXPECT_EQ(*bare, *hit);
}

TEST_F(StaticLookupTest, NotFound) {
    EXPECT_FALSE(find_static_file(search, "nope.png", "index.html").has_value());
}

TEST_F(StaticLookupTest, EscapingRequestsRefused) {
    EXPECT_FALSE(find_static_file(search, "../../outside.txt", "index.html").has_value());
    EXPECT_FALSE(find_static_file(search, "docs/../../../outside.txt", "index.html").has_value());
}

TEST_F(StaticLookupTest, AbsoluteRequestsRefused) {
    EXPECT_FALSE(find_static_file(search, "/main.js", "index.html").has_value());
    EXPECT_FALSE(find_static_file(search, (test_dir / "outside.txt").string(), "index.html").has_value());
}
