#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "ScanError.hpp"

namespace fs = std::filesystem;

constexpr const char* PERMISSIONS_UNAVAILABLE = "?????????? (Permission denied or error)";

FieldResult<std::uintmax_t> fileSize(const fs::path& path);

std::string formatPermissions(const fs::file_status& status);
std::string permissionString(const fs::path& path);

FieldResult<std::string> readFileToString(const fs::path& path);

bool isValidUtf8(const std::string& text);

std::optional<std::string> fileExtension(const std::string& fileName);

// Throws std::invalid_argument for a null name.
std::optional<std::string> fileExtension(const char* fileName);
