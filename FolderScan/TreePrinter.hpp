#pragma once

#include <filesystem>
#include <string>

#include "DirectoryLister.hpp"

namespace fs = std::filesystem;

class TreePrinter
{
public:
	TreePrinter();
	explicit TreePrinter(IDirectoryLister& lister);

	TreePrinter(const TreePrinter&) = delete;
	TreePrinter& operator=(const TreePrinter&) = delete;

	std::string render(const fs::path& root,
		const std::string& indentToken = "|   ",
		const std::string& fileToken = "|-- ",
		const std::string& dirToken = "+-- ");

private:
	DirectoryLister m_defaultLister;
	IDirectoryLister& m_lister;
};
