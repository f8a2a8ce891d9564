#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "Checksum.hpp"
#include "DirectoryLister.hpp"
#include "FileEntry.hpp"

namespace fs = std::filesystem;

constexpr const char* INACCESSIBLE_PERMISSIONS = "d????????? (Permission Denied)";

struct ScanOptions
{
	std::string algorithm = DEFAULT_CHECKSUM_ALGORITHM;
	std::size_t chunkSize = DEFAULT_CHUNK_SIZE;
	bool computeChecksum = true;
	bool readContent = true;
	// hash and capture content from one read when both are enabled
	bool singlePass = true;
};

struct ScanDiagnostic
{
	std::string path;
	ScanError error;
	std::string message;
};

class FileScanner
{
public:
	FileScanner();
	explicit FileScanner(IDirectoryLister& lister, ScanOptions options = ScanOptions());
	explicit FileScanner(ScanOptions options);

	FileScanner(const FileScanner&) = delete;
	FileScanner& operator=(const FileScanner&) = delete;

	std::optional<std::vector<FileEntry>> buildTree(const fs::path& root);

	const std::vector<ScanDiagnostic>& diagnostics() const { return m_diagnostics; }
	const ScanOptions& options() const { return m_options; }

private:
	struct Frame
	{
		fs::path directory;
		std::string relativePath;
		std::vector<fs::path> entries;
		std::size_t next;
	};

	FileEntry describeEntry(const fs::path& fullPath, const std::string& relativePath, fs::file_type type);
	void inspectFile(const fs::path& path, FileEntry& entry);
	void inspectFileSinglePass(const fs::path& path, FileEntry& entry);
	FileEntry inaccessibleMarker(const fs::path& directory, const std::string& relativePath);
	void report(const fs::path& path, ScanError error, const std::string& message);

private:
	DirectoryLister m_defaultLister;
	IDirectoryLister& m_lister;
	ScanOptions m_options;
	std::vector<ScanDiagnostic> m_diagnostics;
};
