#include "b64unpack/errors.hpp"
#include "b64unpack/path_guard.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <string>
#include <system_error>

namespace b64unpack {
namespace {

namespace fs = std::filesystem;

void ExpectTraversal(const std::string& entry, const fs::path& root) {
    try {
        path_guard::ValidateEntryPath(entry, root);
        ADD_FAILURE() << "expected PathTraversal for '" << entry << "'";
    } catch (const Error& err) {
        EXPECT_EQ(err.kind(), ErrorKind::PathTraversal) << entry;
    }
}

TEST(PathGuardTest, AcceptsNestedRelativePaths) {
    testing::TempDir dir;
    auto root = fs::weakly_canonical(dir.path());
    EXPECT_EQ(path_guard::ValidateEntryPath("docs/readme.txt", dir.path()), root / "docs" / "readme.txt");
    EXPECT_EQ(path_guard::ValidateEntryPath("./a/./b.txt", dir.path()), root / "a" / "b.txt");
    EXPECT_EQ(path_guard::ValidateEntryPath("dir/", dir.path()), root / "dir");
}

TEST(PathGuardTest, BackslashIsASeparator) {
    testing::TempDir dir;
    auto root = fs::weakly_canonical(dir.path());
    EXPECT_EQ(path_guard::ValidateEntryPath("win\\style\\file.txt", dir.path()), root / "win" / "style" / "file.txt");
    ExpectTraversal("..\\..\\evil.txt", dir.path());
}

TEST(PathGuardTest, RejectsParentSegmentsEvenWhenTheyStayInside) {
    testing::TempDir dir;
    ExpectTraversal("../../etc/passwd", dir.path());
    ExpectTraversal("..", dir.path());
    ExpectTraversal("a/../b.txt", dir.path());
    ExpectTraversal("a/b/..", dir.path());
}

TEST(PathGuardTest, RejectsAbsoluteAndDrivePaths) {
    testing::TempDir dir;
    ExpectTraversal("/etc/passwd", dir.path());
    ExpectTraversal("\\windows\\system32", dir.path());
    ExpectTraversal("C:\\Windows\\win.ini", dir.path());
    ExpectTraversal("c:relative.txt", dir.path());
}

TEST(PathGuardTest, RejectsEmbeddedNul) {
    testing::TempDir dir;
    ExpectTraversal(std::string("safe.txt\0../../x", 16), dir.path());
}

TEST(PathGuardTest, RootEntryResolvesToRoot) {
    testing::TempDir dir;
    auto root = fs::weakly_canonical(dir.path());
    EXPECT_EQ(path_guard::ValidateEntryPath("./", dir.path()), root);
    EXPECT_EQ(path_guard::ValidateEntryPath(".", dir.path()), root);
}

TEST(PathGuardTest, RejectsEscapeThroughExistingSymlink) {
    testing::TempDir dir;
    testing::TempDir outside;
    fs::create_directories(dir.path() / "out");
    std::error_code ec;
    fs::create_directory_symlink(outside.path(), dir.path() / "out" / "link", ec);
    if (ec) {
        GTEST_SKIP() << "symlinks unavailable: " << ec.message();
    }
    ExpectTraversal("link/owned.txt", dir.path() / "out");
}

TEST(PathGuardTest, WorksWhenRootDoesNotExistYet) {
    testing::TempDir dir;
    auto root = dir.path() / "not" / "yet";
    auto target = path_guard::ValidateEntryPath("x/y.txt", root);
    EXPECT_TRUE(path_guard::IsWithin(fs::weakly_canonical(root), target));
    EXPECT_FALSE(fs::exists(root));
}

TEST(PathGuardTest, IsWithinComparesComponents) {
    EXPECT_TRUE(path_guard::IsWithin("/srv/out", "/srv/out"));
    EXPECT_TRUE(path_guard::IsWithin("/srv/out", "/srv/out/a/b"));
    EXPECT_TRUE(path_guard::IsWithin("/srv/out/", "/srv/out/a"));
    EXPECT_FALSE(path_guard::IsWithin("/srv/out", "/srv/outside/a"));
    EXPECT_FALSE(path_guard::IsWithin("/srv/out", "/srv"));
}

TEST(SizeBudgetTest, ChargesUpToTheLimit) {
    path_guard::SizeBudget budget(100);
    budget.Charge(60);
    budget.Charge(40);
    EXPECT_EQ(budget.Used(), 100u);
    EXPECT_EQ(budget.Remaining(), 0u);
    budget.Charge(0);
}

TEST(SizeBudgetTest, OverrunThrowsAndLeavesTotalUnchanged) {
    path_guard::SizeBudget budget(100);
    budget.Charge(70);
    try {
        budget.Charge(31);
        FAIL() << "expected SizeLimitExceeded";
    } catch (const Error& err) {
        EXPECT_EQ(err.kind(), ErrorKind::SizeLimitExceeded);
    }
    EXPECT_EQ(budget.Used(), 70u);
    EXPECT_EQ(budget.Remaining(), 30u);
}

TEST(SizeBudgetTest, HugeChargeDoesNotOverflow) {
    path_guard::SizeBudget budget(100);
    budget.Charge(1);
    EXPECT_THROW(budget.Charge(UINT64_MAX), Error);
    EXPECT_EQ(budget.Used(), 1u);
}

}  // namespace
}  // namespace b64unpack
