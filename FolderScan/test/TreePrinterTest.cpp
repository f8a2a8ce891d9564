#include "TreePrinter.hpp"
#include "TestUtils.hpp"

#include <gtest/gtest.h>

#include <sstream>

namespace
{
	std::vector<std::string> splitLines(const std::string& text)
	{
		std::vector<std::string> lines;
		std::istringstream in(text);
		for (std::string line; std::getline(in, line);)
		{
			lines.push_back(line);
		}
		return lines;
	}
} // anonymous namespace

TEST(TreePrinterTest, EmptyDirectory) {
	TempDir dir;
	TreePrinter printer;

	EXPECT_EQ(printer.render(dir.path()), "+-- " + dir.path().filename().string() + "/\n");
}

TEST(TreePrinterTest, NonExistentRootRendersNothing) {
	TempDir dir;
	TreePrinter printer;

	EXPECT_EQ(printer.render(dir.path() / "non_existent_dir"), "");
}

TEST(TreePrinterTest, FileRootRendersNothing) {
	TempDir dir;
	fs::path file = dir.writeFile("plain.txt", "x");
	TreePrinter printer;

	EXPECT_EQ(printer.render(file), "");
}

TEST(TreePrinterTest, FilesBeforeSubdirectories) {
	TempDir dir;
	dir.writeFile(fs::path("subdir1") / "subfile1.txt", "sf1");
	dir.writeFile("file1.txt", "f1");

	TreePrinter printer;
	std::vector<std::string> lines = splitLines(printer.render(dir.path()));

	ASSERT_EQ(lines.size(), 4u);
	EXPECT_EQ(lines[0], "+-- " + dir.path().filename().string() + "/");
	EXPECT_EQ(lines[1], "|   |-- file1.txt");
	EXPECT_EQ(lines[2], "|   +-- subdir1/");
	EXPECT_EQ(lines[3], "|   |   |-- subfile1.txt");
}

TEST(TreePrinterTest, NestedDirectoriesFollowTheirParent) {
	TempDir dir;
	dir.writeFile(fs::path("a") / "b" / "deep.txt", "d");

	TreePrinter printer;
	std::vector<std::string> lines = splitLines(printer.render(dir.path()));

	ASSERT_EQ(lines.size(), 4u);
	EXPECT_EQ(lines[1], "|   +-- a/");
	EXPECT_EQ(lines[2], "|   |   +-- b/");
	EXPECT_EQ(lines[3], "|   |   |   |-- deep.txt");
}

TEST(TreePrinterTest, CustomTokens) {
	TempDir dir;
	dir.writeFile(fs::path("sub") / "f.txt", "x");

	TreePrinter printer;
	std::vector<std::string> lines = splitLines(printer.render(dir.path(), "  ", "- ", "* "));

	ASSERT_EQ(lines.size(), 3u);
	EXPECT_EQ(lines[1], "  * sub/");
	EXPECT_EQ(lines[2], "    - f.txt");
}

TEST(TreePrinterTest, UnlistableDirectoryIsSkipped) {
	TempDir dir;
	dir.writeFile(fs::path("locked") / "secret.txt", "s");
	dir.writeFile("open.txt", "o");
	LogCapture log;

	FaultyLister lister;
	lister.fail(dir.path() / "locked", std::errc::permission_denied);

	TreePrinter printer(lister);
	std::vector<std::string> lines = splitLines(printer.render(dir.path()));

	ASSERT_EQ(lines.size(), 2u);
	EXPECT_EQ(lines[1], "|   |-- open.txt");
}

TEST(TreePrinterTest, DirectorySymlinkIsNotPrinted) {
	TempDir dir;
	dir.makeDir("real");
	fs::create_directory_symlink(dir.path() / "real", dir.path() / "alias");

	TreePrinter printer;
	std::vector<std::string> lines = splitLines(printer.render(dir.path()));

	ASSERT_EQ(lines.size(), 2u);
	EXPECT_EQ(lines[1], "|   +-- real/");
}
