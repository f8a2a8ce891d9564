#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>

#include "ScanError.hpp"

namespace fs = std::filesystem;

constexpr const char* DEFAULT_CHECKSUM_ALGORITHM = "sha256";
constexpr std::size_t DEFAULT_CHUNK_SIZE = 4096;
// Larger requested chunks are read in blocks of this size
constexpr std::size_t MAX_CHUNK_SIZE = 1 << 20;

/**
* Name: Digest
* Description: incremental hash accumulator. OpenSSL EVP digests plus zlib crc32/adler32.
*/
class Digest
{
public:
	virtual ~Digest() = default;

	// nullptr when the algorithm is not supported
	static std::unique_ptr<Digest> create(const std::string& algorithm);

	virtual bool update(const char* data, std::size_t size) = 0;

	// Lowercase hex digest, empty on failure. The accumulator is spent afterwards.
	virtual std::string finish() = 0;
};

bool isSupportedAlgorithm(const std::string& algorithm);

FieldResult<std::string> calculateFileChecksum(const fs::path& path,
	const std::string& algorithm = DEFAULT_CHECKSUM_ALGORITHM,
	std::size_t chunkSize = DEFAULT_CHUNK_SIZE);
