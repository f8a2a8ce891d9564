#include "FileInspector.hpp"
#include "Logger.hpp"

#include <cerrno>
#include <fstream>
#include <stdexcept>
#include <vector>

namespace
{
	char typeSymbol(fs::file_type type)
	{
		switch (type)
		{
		case fs::file_type::regular: return '-';
		case fs::file_type::directory: return 'd';
		case fs::file_type::symlink: return 'l';
		case fs::file_type::block: return 'b';
		case fs::file_type::character: return 'c';
		case fs::file_type::fifo: return 'p';
		case fs::file_type::socket: return 's';
		default: return '?';
		}
	}

	bool has(fs::perms perms, fs::perms bit)
	{
		return (perms & bit) != fs::perms::none;
	}

	char executeSymbol(bool execute, bool special, char setLower, char setUpper)
	{
		if (special)
		{
			return execute ? setLower : setUpper;
		}
		return execute ? 'x' : '-';
	}
} // anonymous namespace

/**
* Name: fileSize
* Description: Size in bytes of a regular file
* @Param path - path to file
*/
FieldResult<std::uintmax_t> fileSize(const fs::path& path)
{
	std::error_code ec;
	auto status = fs::status(path, ec);
	if (!fs::exists(status))
	{
		if (ec && ec != std::errc::no_such_file_or_directory)
		{
			LOG(Warn, "Error accessing file '%s': %s", path.string().c_str(), ec.message().c_str());
			return FieldResult<std::uintmax_t>::failure(scanErrorFromCode(ec));
		}
		LOG(Warn, "File not found at '%s'.", path.string().c_str());
		return FieldResult<std::uintmax_t>::failure(ScanError::NotFound);
	}

	if (!fs::is_regular_file(status))
	{
		LOG(Warn, "'%s' is a directory or special file, not a file.", path.string().c_str());
		return FieldResult<std::uintmax_t>::failure(ScanError::NotAFile);
	}

	std::uintmax_t size = fs::file_size(path, ec);
	if (ec)
	{
		LOG(Warn, "Error accessing file '%s': %s", path.string().c_str(), ec.message().c_str());
		return FieldResult<std::uintmax_t>::failure(scanErrorFromCode(ec));
	}

	return FieldResult<std::uintmax_t>::success(size);
}

/**
* Name: formatPermissions
* Description: Render mode bits the way ls -l does, e.g. "drwxr-xr-x"
* @Param status - status of the entry, not following symlinks
*/
std::string formatPermissions(const fs::file_status& status)
{
	const fs::perms p = status.permissions();

	std::string mode(10, '-');
	mode[0] = typeSymbol(status.type());

	mode[1] = has(p, fs::perms::owner_read) ? 'r' : '-';
	mode[2] = has(p, fs::perms::owner_write) ? 'w' : '-';
	mode[3] = executeSymbol(has(p, fs::perms::owner_exec), has(p, fs::perms::set_uid), 's', 'S');

	mode[4] = has(p, fs::perms::group_read) ? 'r' : '-';
	mode[5] = has(p, fs::perms::group_write) ? 'w' : '-';
	mode[6] = executeSymbol(has(p, fs::perms::group_exec), has(p, fs::perms::set_gid), 's', 'S');

	mode[7] = has(p, fs::perms::others_read) ? 'r' : '-';
	mode[8] = has(p, fs::perms::others_write) ? 'w' : '-';
	mode[9] = executeSymbol(has(p, fs::perms::others_exec), has(p, fs::perms::sticky_bit), 't', 'T');

	return mode;
}

/**
* Name: permissionString
* Description: Permission string of the entry itself, or a sentinel when it cannot be queried
* @Param path - path to entry
*/
std::string permissionString(const fs::path& path)
{
	std::error_code ec;
	auto status = fs::symlink_status(path, ec);
	if (ec || status.type() == fs::file_type::not_found || status.type() == fs::file_type::none)
	{
		LOG(Warn, "Could not get permissions for %s: %s", path.string().c_str(),
			ec ? ec.message().c_str() : "not found");
		return PERMISSIONS_UNAVAILABLE;
	}

	return formatPermissions(status);
}

/**
* Name: readFileToString
* Description: Read a whole file and check it decodes as UTF-8
* @Param path - path to file
*/
FieldResult<std::string> readFileToString(const fs::path& path)
{
	errno = 0;
	std::ifstream file(path, std::ios::binary);
	if (!file)
	{
		ScanError reason = classifyOpenFailure(path, errno);
		LOG(Warn, "Could not open '%s' for reading (%s).", path.string().c_str(), scanErrorToString(reason));
		return FieldResult<std::string>::failure(reason);
	}

	std::error_code ec;
	if (fs::is_directory(path, ec))
	{
		LOG(Warn, "'%s' is a directory, not a file.", path.string().c_str());
		return FieldResult<std::string>::failure(ScanError::NotAFile);
	}

	std::string content;
	std::vector<char> buffer(1 << 16);
	while (file)
	{
		file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
		std::streamsize count = file.gcount();
		if (0 < count)
		{
			content.append(buffer.data(), static_cast<std::size_t>(count));
		}
	}

	if (file.bad())
	{
		LOG(Warn, "Read error on '%s'.", path.string().c_str());
		return FieldResult<std::string>::failure(ScanError::IOFailure);
	}

	if (!isValidUtf8(content))
	{
		LOG(Warn, "'%s' is not valid UTF-8.", path.string().c_str());
		return FieldResult<std::string>::failure(ScanError::DecodeError);
	}

	return FieldResult<std::string>::success(std::move(content));
}

/**
* Name: isValidUtf8
* Description: Strict UTF-8 check; rejects overlong forms, surrogates and code points past U+10FFFF
* @Param text - raw bytes
*/
bool isValidUtf8(const std::string& text)
{
	const auto* s = reinterpret_cast<const unsigned char*>(text.data());
	const std::size_t n = text.size();
	std::size_t i = 0;

	while (i < n)
	{
		unsigned char c = s[i];
		if (c < 0x80)
		{
			++i;
			continue;
		}

		std::size_t len = 0;
		unsigned char lo = 0x80;
		unsigned char hi = 0xBF;

		if (c >= 0xC2 && c <= 0xDF)
		{
			len = 2;
		}
		else if (c >= 0xE0 && c <= 0xEF)
		{
			len = 3;
			if (c == 0xE0) lo = 0xA0;
			if (c == 0xED) hi = 0x9F;
		}
		else if (c >= 0xF0 && c <= 0xF4)
		{
			len = 4;
			if (c == 0xF0) lo = 0x90;
			if (c == 0xF4) hi = 0x8F;
		}
		else
		{
			return false;
		}

		if (i + len > n)
		{
			return false;
		}

		// only the first continuation byte has a narrowed range
		if (s[i + 1] < lo || s[i + 1] > hi)
		{
			return false;
		}
		for (std::size_t k = 2; k < len; ++k)
		{
			if (s[i + k] < 0x80 || s[i + k] > 0xBF)
			{
				return false;
			}
		}

		i += len;
	}

	return true;
}

/**
* Name: fileExtension
* Description: Extension after the last dot, without the dot. Leading dots belong to the stem,
* so ".bashrc" has none while ".config.fish" gives "fish".
* @Param fileName - base name of the entry
*/
std::optional<std::string> fileExtension(const std::string& fileName)
{
	const std::size_t sep = fileName.find_last_of("/\\");
	const std::size_t start = (sep == std::string::npos) ? 0 : sep + 1;

	const std::size_t dot = fileName.rfind('.');
	if (dot == std::string::npos || dot < start)
	{
		return std::nullopt;
	}

	const std::size_t stem = fileName.find_first_not_of('.', start);
	if (stem == std::string::npos || stem > dot)
	{
		return std::nullopt;
	}

	std::string extension = fileName.substr(dot + 1);
	if (extension.empty())
	{
		return std::nullopt;
	}

	return extension;
}

std::optional<std::string> fileExtension(const char* fileName)
{
	if (nullptr == fileName)
	{
		throw std::invalid_argument("Input must be a string.");
	}
	return fileExtension(std::string(fileName));
}
