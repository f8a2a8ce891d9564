#include "TreePrinter.hpp"
#include "DirectoryLister.hpp"
#include "Logger.hpp"

#include <utility>
#include <vector>

namespace
{
	std::string repeat(const std::string& token, std::size_t count)
	{
		std::string out;
		out.reserve(token.size() * count);
		for (std::size_t i = 0; i < count; ++i)
		{
			out += token;
		}
		return out;
	}
} // anonymous namespace

TreePrinter::TreePrinter() :
	m_lister(m_defaultLister) {}

TreePrinter::TreePrinter(IDirectoryLister& lister) :
	m_lister(lister) {}

/**
* Name: TreePrinter::render
* Description: Indented text view of the tree, top-down. Each directory line is followed by
* its files, then by its subdirectories. Unlistable directories and directory symlinks are left out.
* @Param root - directory to render
* @Param indentToken - repeated once per depth level
* @Param fileToken - prefix of file lines
* @Param dirToken - prefix of directory lines
*/
std::string TreePrinter::render(const fs::path& root, const std::string& indentToken,
	const std::string& fileToken, const std::string& dirToken)
{
	LOG(Debug, "Entry.");

	std::string tree;

	std::error_code ec;
	if (!fs::is_directory(root, ec))
	{
		LOG(Debug, "Root %s is not a directory.", root.string().c_str());
		return tree;
	}

	const fs::path start = resolveRoot(root);

	std::vector<std::pair<fs::path, std::size_t>> pending;
	pending.emplace_back(start, 0);

	while (!pending.empty())
	{
		auto [directory, level] = pending.back();
		pending.pop_back();

		std::vector<fs::path> listing = m_lister.list(directory, ec);
		if (ec)
		{
			LOG(Warn, "Could not list directory %s: %s", directory.string().c_str(), ec.message().c_str());
			continue;
		}

		std::string name = directory.filename().empty() ? directory.string() : directory.filename().string();
		tree += repeat(indentToken, level) + dirToken + name + "/\n";

		const std::string subIndent = repeat(indentToken, level + 1);
		std::vector<fs::path> subdirectories;

		for (const fs::path& entry : listing)
		{
			auto status = fs::symlink_status(entry, ec);
			if (fs::is_directory(status))
			{
				subdirectories.push_back(entry);
				continue;
			}
			if (fs::is_symlink(status) && fs::is_directory(entry, ec))
			{
				continue;
			}
			tree += subIndent + fileToken + entry.filename().string() + "\n";
		}

		// reverse so the first subdirectory is rendered first
		for (auto it = subdirectories.rbegin(); it != subdirectories.rend(); ++it)
		{
			pending.emplace_back(*it, level + 1);
		}
	}

	LOG(Debug, "Exit.");
	return tree;
}
