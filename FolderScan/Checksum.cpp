#include "Checksum.hpp"
#include "Logger.hpp"

#include <openssl/evp.h>
#include <zlib.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <vector>

namespace
{
	struct EvpMdCtxDeleter
	{
		void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
	};

	std::string normalizeAlgorithm(const std::string& algorithm)
	{
		std::string name(algorithm);
		std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c)
			{
				return c == '_' ? '-' : static_cast<char>(std::tolower(c));
			});
		return name;
	}

	// Fixed-length EVP digest for the name, or nullptr.
	const EVP_MD* lookupEvpDigest(const std::string& name)
	{
		if (name.empty())
		{
			return nullptr;
		}

		const EVP_MD* md = EVP_get_digestbyname(name.c_str());
		if (!md)
		{
			return nullptr;
		}

		if (EVP_MD_flags(md) & EVP_MD_FLAG_XOF)
		{
			return nullptr;
		}

		return md;
	}

	std::string toHex(const unsigned char* data, std::size_t size)
	{
		std::ostringstream ss;
		ss << std::hex << std::setfill('0');

		for (std::size_t i = 0; i < size; ++i)
		{
			ss << std::setw(2) << static_cast<int>(data[i]);
		}

		return ss.str();
	}

	class EvpDigest : public Digest
	{
	public:
		explicit EvpDigest(const EVP_MD* md) : m_md(md), m_ctx(EVP_MD_CTX_new()) {}

		bool init()
		{
			if (!m_ctx)
			{
				LOG(Error, "Failed to create EVP context");
				return false;
			}

			if (1 != EVP_DigestInit_ex(m_ctx.get(), m_md, nullptr))
			{
				LOG(Error, "Failed to init EVP.");
				return false;
			}

			return true;
		}

		bool update(const char* data, std::size_t size) override
		{
			if (1 != EVP_DigestUpdate(m_ctx.get(), data, size))
			{
				LOG(Error, "Update failed.");
				return false;
			}
			return true;
		}

		std::string finish() override
		{
			std::vector<unsigned char> hash(EVP_MAX_MD_SIZE);
			unsigned int hashLen = 0;

			if (1 != EVP_DigestFinal_ex(m_ctx.get(), hash.data(), &hashLen))
			{
				LOG(Error, "Final failed.");
				return std::string();
			}

			return toHex(hash.data(), hashLen);
		}

	private:
		const EVP_MD* m_md;
		std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter> m_ctx;
	};

	class ZlibDigest : public Digest
	{
	public:
		enum class Kind { Crc32 = 0, Adler32 };

		explicit ZlibDigest(Kind kind) :
			m_kind(kind), m_value(kind == Kind::Crc32 ? crc32(0L, Z_NULL, 0) : adler32(0L, Z_NULL, 0)) {}

		bool update(const char* data, std::size_t size) override
		{
			const Bytef* bytes = reinterpret_cast<const Bytef*>(data);

			// zlib takes uInt lengths
			while (size > 0)
			{
				uInt len = static_cast<uInt>(std::min<std::size_t>(size, 1u << 30));
				m_value = (Kind::Crc32 == m_kind) ? crc32(m_value, bytes, len) : adler32(m_value, bytes, len);
				bytes += len;
				size -= len;
			}
			return true;
		}

		std::string finish() override
		{
			unsigned char be[4] = {
				static_cast<unsigned char>((m_value >> 24) & 0xFF),
				static_cast<unsigned char>((m_value >> 16) & 0xFF),
				static_cast<unsigned char>((m_value >> 8) & 0xFF),
				static_cast<unsigned char>(m_value & 0xFF) };
			return toHex(be, sizeof(be));
		}

	private:
		Kind m_kind;
		uLong m_value;
	};
} // anonymous namespace

/**
* Name: Digest::create
* Description: Create an accumulator for the named algorithm
* @Param algorithm - e.g. "sha256", "md5", "sha3_256", "crc32"
*/
std::unique_ptr<Digest> Digest::create(const std::string& algorithm)
{
	const std::string name = normalizeAlgorithm(algorithm);

	if ("crc32" == name)
	{
		return std::make_unique<ZlibDigest>(ZlibDigest::Kind::Crc32);
	}
	if ("adler32" == name)
	{
		return std::make_unique<ZlibDigest>(ZlibDigest::Kind::Adler32);
	}

	const EVP_MD* md = lookupEvpDigest(name);
	if (!md)
	{
		return nullptr;
	}

	auto digest = std::make_unique<EvpDigest>(md);
	if (!digest->init())
	{
		return nullptr;
	}

	return digest;
}

bool isSupportedAlgorithm(const std::string& algorithm)
{
	const std::string name = normalizeAlgorithm(algorithm);
	return "crc32" == name || "adler32" == name || nullptr != lookupEvpDigest(name);
}

/**
* Name: calculateFileChecksum
* Description: Hash a file chunk by chunk with the selected algorithm
* @Param path - path to file
* @Param algorithm - digest name
* @Param chunkSize - bytes read per block
*/
FieldResult<std::string> calculateFileChecksum(const fs::path& path, const std::string& algorithm, std::size_t chunkSize)
{
	LOG(Debug, "Entry, path: %s.", path.string().c_str());

	if (!isSupportedAlgorithm(algorithm))
	{
		LOG(Warn, "Unsupported hash algorithm '%s'.", algorithm.c_str());
		return FieldResult<std::string>::failure(ScanError::UnsupportedAlgorithm);
	}

	std::unique_ptr<Digest> digest = Digest::create(algorithm);
	if (!digest)
	{
		return FieldResult<std::string>::failure(ScanError::IOFailure);
	}

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
		return FieldResult<std::string>::failure(reason);
	}

	std::error_code ec;
	if (fs::is_directory(path, ec))
	{
		LOG(Warn, "'%s' is a directory, not a file.", path.string().c_str());
		return FieldResult<std::string>::failure(ScanError::NotAFile);
	}

	std::vector<char> buffer(chunkSize);

	while (file)
	{
		file.read(buffer.data(), static_cast<std::streamsize>(chunkSize));
		std::streamsize streamSize = file.gcount();

		if (0 < streamSize)
		{
			if (!digest->update(buffer.data(), static_cast<std::size_t>(streamSize)))
			{
				return FieldResult<std::string>::failure(ScanError::IOFailure);
			}
		}
	}

	if (file.bad())
	{
		LOG(Warn, "Read error while hashing: %s.", path.string().c_str());
		return FieldResult<std::string>::failure(ScanError::IOFailure);
	}

	std::string hex = digest->finish();
	if (hex.empty())
	{
		return FieldResult<std::string>::failure(ScanError::IOFailure);
	}

	LOG(Debug, "Exit.");
	return FieldResult<std::string>::success(hex);
}
