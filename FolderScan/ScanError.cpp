#include "ScanError.hpp"

#include <cerrno>

/**
* Name: scanErrorToString
* Description: Stable lowercase name used in diagnostics and CLI output
* @Param error - error kind
*/
const char* scanErrorToString(ScanError error)
{
	switch (error)
	{
	case ScanError::None: return "none";
	case ScanError::NotFound: return "not_found";
	case ScanError::AccessDenied: return "access_denied";
	case ScanError::NotAFile: return "not_a_file";
	case ScanError::NotADirectory: return "not_a_directory";
	case ScanError::DecodeError: return "decode_error";
	case ScanError::UnsupportedAlgorithm: return "unsupported_algorithm";
	case ScanError::IOFailure: return "io_failure";
	default: return "unknown";
	}
}

/**
* Name: scanErrorFromCode
* Description: Classify an OS error code
* @Param ec - error code reported by std::filesystem or errno
*/
ScanError scanErrorFromCode(const std::error_code& ec)
{
	if (!ec)
	{
		return ScanError::None;
	}

	if (ec == std::errc::no_such_file_or_directory)
	{
		return ScanError::NotFound;
	}
	if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted)
	{
		return ScanError::AccessDenied;
	}
	if (ec == std::errc::not_a_directory)
	{
		return ScanError::NotADirectory;
	}
	if (ec == std::errc::is_a_directory)
	{
		return ScanError::NotAFile;
	}

	return ScanError::IOFailure;
}

/**
* Name: classifyOpenFailure
* Description: Work out why a file could not be opened
* @Param path - path that failed to open
* @Param savedErrno - errno right after the failed open, 0 if unknown
*/
ScanError classifyOpenFailure(const std::filesystem::path& path, int savedErrno)
{
	std::error_code ec;
	auto status = std::filesystem::status(path, ec);
	if (ec || !std::filesystem::exists(status))
	{
		if (ec && ec != std::errc::no_such_file_or_directory)
		{
			return scanErrorFromCode(ec);
		}
		return ScanError::NotFound;
	}
	if (std::filesystem::is_directory(status))
	{
		return ScanError::NotAFile;
	}

	if (savedErrno != 0)
	{
		return scanErrorFromCode(std::error_code(savedErrno, std::generic_category()));
	}

	return ScanError::IOFailure;
}
