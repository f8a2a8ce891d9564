#include "FileEntry.hpp"

const char* entryTypeToString(EntryType type)
{
	switch (type)
	{
	case EntryType::File: return "file";
	case EntryType::Directory: return "directory";
	case EntryType::Other: return "other";
	case EntryType::DirectoryInaccessible: return "directory_inaccessible";
	default: return "unknown";
	}
}
