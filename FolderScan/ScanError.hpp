#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <system_error>
#include <utility>

enum class ScanError
{
	None = 0,
	NotFound,
	AccessDenied,
	NotAFile,
	NotADirectory,
	DecodeError,
	UnsupportedAlgorithm,
	IOFailure
};

const char* scanErrorToString(ScanError error);

// Maps an OS error to the closest ScanError; anything unrecognised is IOFailure.
ScanError scanErrorFromCode(const std::error_code& ec);

// Reason a file could not be opened for reading. savedErrno is errno captured right after the failed open.
ScanError classifyOpenFailure(const std::filesystem::path& path, int savedErrno);

/**
* Name: FieldResult
* Description: value of a single descriptor field, or the reason it could not be computed.
* An empty value with ScanError::None means the field does not apply to the entry.
*/
template <typename T>
struct FieldResult
{
	std::optional<T> value;
	ScanError error = ScanError::None;

	static FieldResult success(T v)
	{
		FieldResult result;
		result.value = std::move(v);
		return result;
	}

	static FieldResult failure(ScanError e)
	{
		FieldResult result;
		result.error = e;
		return result;
	}

	bool ok() const { return value.has_value(); }
	explicit operator bool() const { return ok(); }
};
