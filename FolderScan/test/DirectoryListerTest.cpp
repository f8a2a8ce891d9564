#include "DirectoryLister.hpp"
#include "TestUtils.hpp"

#include <gtest/gtest.h>

#include <algorithm>

TEST(DirectoryListerTest, ListsOneLevel) {
	TempDir dir;
	dir.writeFile("a.txt", "a");
	dir.writeFile(fs::path("sub") / "b.txt", "b");

	DirectoryLister lister;
	std::error_code ec;
	std::vector<fs::path> entries = lister.list(dir.path(), ec);
	EXPECT_FALSE(ec);
	ASSERT_EQ(entries.size(), 2u);
	EXPECT_NE(std::find(entries.begin(), entries.end(), dir.path() / "a.txt"), entries.end());
	EXPECT_NE(std::find(entries.begin(), entries.end(), dir.path() / "sub"), entries.end());
}

TEST(DirectoryListerTest, MissingDirectorySetsError) {
	TempDir dir;
	DirectoryLister lister;
	std::error_code ec;

	EXPECT_TRUE(lister.list(dir.path() / "missing", ec).empty());
	EXPECT_TRUE(ec);
}

TEST(ResolveRootTest, StripsTrailingSeparatorAndDots) {
	EXPECT_EQ(resolveRoot("/tmp/a/./b/../c/"), fs::path("/tmp/a/c"));
	EXPECT_EQ(resolveRoot("/"), fs::path("/"));
	EXPECT_TRUE(resolveRoot("relative").is_absolute());
}
