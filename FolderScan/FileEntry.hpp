#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "ScanError.hpp"

enum class EntryType { File = 0, Directory, Other, DirectoryInaccessible };

const char* entryTypeToString(EntryType type);

struct FileEntry
{
	std::string name;
	std::string fullPath;
	std::string relativePath;
	std::string permissions;
	std::optional<std::string> checksum;
	std::optional<std::uintmax_t> size;
	std::optional<std::string> extension;
	std::optional<std::string> content;
	EntryType type = EntryType::Other;

	// Why a field is empty; None when it simply does not apply.
	ScanError checksumError = ScanError::None;
	ScanError sizeError = ScanError::None;
	ScanError contentError = ScanError::None;
};
