#include <gtest/gtest.h>
#include <server/connection_dir.hpp>
#include "scratch_dir.hpp"
#include <type_traits>
#include <utility>

class ConnectionDirTest : public ScratchDirTest {};

TEST_F(ConnectionDirTest, CreatedUnderRootWithPrefix) {
    auto r = ConnectionDir::create(test_dir);
    ASSERT_TRUE(r.is_ok()) << r.error;
    ConnectionDir dir = std::move(r.value);

    EXPECT_TRUE(dir.valid());
    EXPECT_TRUE(fs::is_directory(dir.path()));
    EXPECT_EQ(dir.path().parent_path(), test_dir);
    EXPECT_EQ(dir.path().filename().string().rfind("folio_", 0), 0u);
}

TEST_F(ConnectionDirTest, RemovedWithContentsOnDestruction) {
    fs::path created;
    {
        auto r = ConnectionDir::create(test_dir);
        ASSERT_TRUE(r.is_ok()) << r.error;
        ConnectionDir dir = std::move(r.value);
        created = dir.path();
        std::ofstream(created / "kernel-1234.json") << "{}";
    }
    EXPECT_FALSE(fs::exists(created));
}

TEST_F(ConnectionDirTest, MoveTransfersOwnership) {
    auto r = ConnectionDir::create(test_dir);
    ASSERT_TRUE(r.is_ok()) << r.error;
    ConnectionDir first = std::move(r.value);
    fs::path p = first.path();

    ConnectionDir second = std::move(first);
    EXPECT_FALSE(first.valid());
    EXPECT_EQ(second.path(), p);
    EXPECT_TRUE(fs::exists(p));

    second.remove();
    EXPECT_FALSE(fs::exists(p));
}

TEST_F(ConnectionDirTest, TwoDirectoriesAreDistinct) {
    auto a = ConnectionDir::create(test_dir);
    auto b = ConnectionDir::create(test_dir);
    ASSERT_TRUE(a.is_ok() && b.is_ok());
    EXPECT_NE(a.value.path(), b.value.path());
}

TEST_F(ConnectionDirTest, MissingRootIsError) {
    auto r = ConnectionDir::create(test_dir / "does" / "not" / "exist");
    EXPECT_TRUE(r.is_err());
}

TEST_F(ConnectionDirTest, CleanupNeverThrows) {
    static_assert(std::is_nothrow_destructible_v<ConnectionDir>);
    static_assert(std::is_nothrow_move_assignable_v<ConnectionDir>);
    static_assert(noexcept(std::declval<ConnectionDir&>().remove()));

    auto r = ConnectionDir::create(test_dir);
    ASSERT_TRUE(r.is_ok()) << r.error;
    ConnectionDir dir = std::move(r.value);

    // Already gone from under the owner
    fs::remove_all(dir.path());
    dir.remove();
    EXPECT_FALSE(dir.valid());

    auto other = ConnectionDir::create(test_dir);
    ASSERT_TRUE(other.is_ok()) << other.error;
    fs::path kept = other.value.path();
    dir = std::move(other.value);
    EXPECT_EQ(dir.path(), kept);
    EXPECT_TRUE(fs::exists(kept));
}
