#include "FileScanner.hpp"
#include "FileInspector.hpp"
#include "Logger.hpp"

#include <algorithm>
#include <cerrno>
#include <fstream>
#include <memory>
#include <utility>

/**
* Name: FileScanner::FileScanner
* Description: Constructor, lists directories through std::filesystem
*/
FileScanner::FileScanner() :
	m_lister(m_defaultLister) {}

/**
* Name: FileScanner::FileScanner
* Description: Constructor
* @Param lister - directory lister used for every level of the walk
* @Param options - what to compute per file
*/
FileScanner::FileScanner(IDirectoryLister& lister, ScanOptions options) :
	m_lister(lister), m_options(std::move(options)) {}

FileScanner::FileScanner(ScanOptions options) :
	m_lister(m_defaultLister), m_options(std::move(options)) {}

/**
* Name: FileScanner::buildTree
* Description: Walk the root depth-first and describe every entry below it.
* A directory is emitted before its contents, which follow it directly in the flat list.
* @Param root - directory to scan, absolute or relative
* @Return nullopt if the root does not exist or is not a directory
*/
std::optional<std::vector<FileEntry>> FileScanner::buildTree(const fs::path& root)
{
	LOG(Debug, "Entry.");

	m_diagnostics.clear();

	const fs::path absRoot = resolveRoot(root);

	std::error_code ec;
	auto rootStatus = fs::status(absRoot, ec);
	if (!fs::exists(rootStatus))
	{
		LOG(Error, "Path '%s' does not exist.", root.string().c_str());
		return std::nullopt;
	}
	if (!fs::is_directory(rootStatus))
	{
		LOG(Error, "Path '%s' is not a directory.", root.string().c_str());
		return std::nullopt;
	}

	std::vector<FileEntry> entries;

	std::vector<fs::path> listing = m_lister.list(absRoot, ec);
	if (ec)
	{
		ScanError reason = scanErrorFromCode(ec);
		report(absRoot, reason, ec.message());
		if (ScanError::AccessDenied == reason)
		{
			LOG(Warn, "Permission denied to access directory %s", absRoot.string().c_str());
			std::string name = absRoot.filename().empty() ? absRoot.string() : absRoot.filename().string();
			entries.push_back(inaccessibleMarker(absRoot, name));
		}
		else
		{
			LOG(Warn, "Could not list directory %s: %s", absRoot.string().c_str(), ec.message().c_str());
		}
		return entries;
	}

	std::vector<Frame> stack;
	stack.push_back(Frame{ absRoot, std::string(), std::move(listing), 0 });

	while (!stack.empty())
	{
		Frame& frame = stack.back();
		if (frame.next >= frame.entries.size())
		{
			stack.pop_back();
			continue;
		}

		const fs::path fullPath = frame.entries[frame.next++];
		const std::string name = fullPath.filename().string();
		const std::string relativePath = frame.relativePath.empty()
			? name
			: (fs::path(frame.relativePath) / name).string();

		// symlinks are described, never followed
		auto status = fs::symlink_status(fullPath, ec);
		if (ec)
		{
			LOG(Warn, "Could not stat %s: %s", fullPath.string().c_str(), ec.message().c_str());
			report(fullPath, scanErrorFromCode(ec), ec.message());
		}

		if (fs::is_directory(status))
		{
			std::vector<fs::path> children = m_lister.list(fullPath, ec);
			if (ec)
			{
				ScanError reason = scanErrorFromCode(ec);
				report(fullPath, reason, ec.message());

				if (ScanError::AccessDenied == reason)
				{
					LOG(Warn, "Permission denied to access directory %s", fullPath.string().c_str());
					entries.push_back(inaccessibleMarker(fullPath, relativePath));
				}
				else
				{
					LOG(Warn, "Could not list directory %s: %s", fullPath.string().c_str(), ec.message().c_str());
					entries.push_back(describeEntry(fullPath, relativePath, fs::file_type::directory));
				}
				continue;
			}

			entries.push_back(describeEntry(fullPath, relativePath, fs::file_type::directory));
			// invalidates frame
			stack.push_back(Frame{ fullPath, relativePath, std::move(children), 0 });
			continue;
		}

		entries.push_back(describeEntry(fullPath, relativePath, status.type()));
	}

	LOG(Debug, "Exit, %zu entries.", entries.size());
	return entries;
}

/**
* Name: FileScanner::describeEntry
* Description: Build the descriptor of a single entry
* @Param fullPath - absolute path to entry
* @Param relativePath - path relative to the scan root
* @Param type - entry type, symlinks not followed
*/
FileEntry FileScanner::describeEntry(const fs::path& fullPath, const std::string& relativePath, fs::file_type type)
{
	FileEntry entry;
	entry.name = fullPath.filename().string();
	entry.fullPath = fullPath.string();
	entry.relativePath = relativePath;
	entry.permissions = permissionString(fullPath);

	switch (type)
	{
	case fs::file_type::regular:
		entry.type = EntryType::File;
		entry.extension = fileExtension(entry.name);
		inspectFile(fullPath, entry);
		break;
	case fs::file_type::directory:
		entry.type = EntryType::Directory;
		break;
	default:
		entry.type = EntryType::Other;
		break;
	}

	return entry;
}

/**
* Name: FileScanner::inspectFile
* Description: Fill size, checksum and content of a regular file. Failures only clear the field.
* @Param path - absolute path to file
* @Param entry - descriptor to fill
*/
void FileScanner::inspectFile(const fs::path& path, FileEntry& entry)
{
	auto size = fileSize(path);
	entry.size = size.value;
	entry.sizeError = size.error;
	if (!size)
	{
		report(path, size.error, "size unavailable");
	}

	if (m_options.computeChecksum && m_options.readContent && m_options.singlePass)
	{
		inspectFileSinglePass(path, entry);
		return;
	}

	if (m_options.computeChecksum)
	{
		auto checksum = calculateFileChecksum(path, m_options.algorithm, m_options.chunkSize);
		entry.checksum = checksum.value;
		entry.checksumError = checksum.error;
		if (!checksum)
		{
			report(path, checksum.error, "checksum unavailable");
		}
	}

	if (m_options.readContent)
	{
		auto content = readFileToString(path);
		entry.content = std::move(content.value);
		entry.contentError = content.error;
		if (ScanError::None != content.error)
		{
			report(path, content.error, "content unavailable");
		}
	}
}

/**
* Name: FileScanner::inspectFileSinglePass
* Description: Hash and capture content from one read of the file
* @Param path - absolute path to file
* @Param entry - descriptor to fill
*/
void FileScanner::inspectFileSinglePass(const fs::path& path, FileEntry& entry)
{
	std::unique_ptr<Digest> digest;
	if (!isSupportedAlgorithm(m_options.algorithm))
	{
		LOG(Warn, "Unsupported hash algorithm '%s'.", m_options.algorithm.c_str());
		entry.checksumError = ScanError::UnsupportedAlgorithm;
		report(path, entry.checksumError, "checksum unavailable");
	}
	else
	{
		digest = Digest::create(m_options.algorithm);
		if (!digest)
		{
			entry.checksumError = ScanError::IOFailure;
			report(path, entry.checksumError, "checksum unavailable");
		}
	}

	std::size_t chunkSize = m_options.chunkSize;
	if (0 == chunkSize)
	{
		LOG(Warn, "Chunk size 0 requested, using %zu.", DEFAULT_CHUNK_SIZE);
		chunkSize = DEFAULT_CHUNK_SIZE;
	}
	chunkSize = std::min(chunkSize, MAX_CHUNK_SIZE);

	errno = 0;
	std::ifstream file(path, std::ios::binary);
	if (!file)
	{
		ScanError reason = classifyOpenFailure(path, errno);
		LOG(Warn, "Failed to open file: %s (%s).", path.string().c_str(), scanErrorToString(reason));
		if (digest)
		{
			entry.checksumError = reason;
		}
		entry.contentError = reason;
		report(path, reason, "file unreadable");
		return;
	}

	std::string content;
	std::vector<char> buffer(chunkSize);

	while (file)
	{
		file.read(buffer.data(), static_cast<std::streamsize>(chunkSize));
		std::streamsize streamSize = file.gcount();

		if (0 < streamSize)
		{
			if (digest && !digest->update(buffer.data(), static_cast<std::size_t>(streamSize)))
			{
				digest.reset();
				entry.checksumError = ScanError::IOFailure;
				report(path, entry.checksumError, "checksum unavailable");
			}
			content.append(buffer.data(), static_cast<std::size_t>(streamSize));
		}
	}

	if (file.bad())
	{
		LOG(Warn, "Read error on '%s'.", path.string().c_str());
		if (digest)
		{
			entry.checksumError = ScanError::IOFailure;
		}
		entry.contentError = ScanError::IOFailure;
		report(path, ScanError::IOFailure, "file unreadable");
		return;
	}

	if (digest)
	{
		std::string hex = digest->finish();
		if (hex.empty())
		{
			entry.checksumError = ScanError::IOFailure;
			report(path, entry.checksumError, "checksum unavailable");
		}
		else
		{
			entry.checksum = std::move(hex);
		}
	}

	if (isValidUtf8(content))
	{
		entry.content = std::move(content);
	}
	else
	{
		LOG(Warn, "'%s' is not valid UTF-8.", path.string().c_str());
		entry.contentError = ScanError::DecodeError;
		report(path, entry.contentError, "content unavailable");
	}
}

/**
* Name: FileScanner::inaccessibleMarker
* Description: Leaf descriptor standing in for a directory that could not be listed
* @Param directory - absolute path to directory
* @Param relativePath - best-effort path relative to the scan root
*/
FileEntry FileScanner::inaccessibleMarker(const fs::path& directory, const std::string& relativePath)
{
	FileEntry entry;
	entry.name = directory.filename().empty() ? directory.string() : directory.filename().string();
	entry.fullPath = directory.string();
	entry.relativePath = relativePath;
	entry.permissions = INACCESSIBLE_PERMISSIONS;
	entry.type = EntryType::DirectoryInaccessible;
	return entry;
}

void FileScanner::report(const fs::path& path, ScanError error, const std::string& message)
{
	m_diagnostics.push_back(ScanDiagnostic{ path.string(), error, message });
}
