#pragma once

#include <filesystem>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

class IDirectoryLister
{
public:
	virtual ~IDirectoryLister() = default;

	// Entries of one directory level in listing order. On failure ec is set and the result is empty.
	virtual std::vector<fs::path> list(const fs::path& directory, std::error_code& ec) = 0;
};

class DirectoryLister : public IDirectoryLister
{
public:
	std::vector<fs::path> list(const fs::path& directory, std::error_code& ec) override;
};

// Absolute, normalized, without a trailing separator.
fs::path resolveRoot(const fs::path& root);
