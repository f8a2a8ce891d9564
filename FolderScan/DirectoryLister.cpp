#include "DirectoryLister.hpp"

/**
* Name: DirectoryLister::list
* Description: List one directory level. The listing is all or nothing.
* @Param directory - directory to list
* @Param ec - set on failure
*/
std::vector<fs::path> DirectoryLister::list(const fs::path& directory, std::error_code& ec)
{
	ec.clear();
	std::vector<fs::path> entries;

	fs::directory_iterator it(directory, ec);
	if (ec)
	{
		return {};
	}

	for (; it != fs::directory_iterator(); it.increment(ec))
	{
		entries.emplace_back(it->path());
	}

	if (ec)
	{
		return {};
	}

	return entries;
}

/**
* Name: resolveRoot
* Description: Make the scan root absolute and drop "." / ".." segments and any trailing separator
* @Param root - path given by the caller
*/
fs::path resolveRoot(const fs::path& root)
{
	std::error_code ec;
	fs::path absolute = fs::absolute(root, ec);
	if (ec)
	{
		absolute = root;
	}

	fs::path normal = absolute.lexically_normal();
	if (normal.filename().empty() && normal != normal.root_path())
	{
		normal = normal.parent_path();
	}

	return normal;
}
