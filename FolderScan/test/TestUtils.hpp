#pragma once

#include <atomic>
#include <filesystem>
#include <fstream>
#include <map>
#include <string>
#include <system_error>
#include <vector>

#include <unistd.h>

#include "DirectoryLister.hpp"
#include "Logger.hpp"

namespace fs = std::filesystem;

// Fresh directory under the system temp dir, removed with everything in it.
class TempDir
{
public:
	TempDir()
	{
		static std::atomic<int> counter{ 0 };
		m_path = fs::temp_directory_path() /
			("folderscan_test_" + std::to_string(::getpid()) + "_" + std::to_string(counter++));
		fs::remove_all(m_path);
		fs::create_directories(m_path);
	}

	~TempDir()
	{
		std::error_code ec;
		fs::remove_all(m_path, ec);
	}

	TempDir(const TempDir&) = delete;
	TempDir& operator=(const TempDir&) = delete;

	const fs::path& path() const { return m_path; }

	fs::path writeFile(const fs::path& relative, const std::string& bytes) const
	{
		fs::path full = m_path / relative;
		fs::create_directories(full.parent_path());
		std::ofstream out(full, std::ios::binary);
		out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
		return full;
	}

	fs::path makeDir(const fs::path& relative) const
	{
		fs::path full = m_path / relative;
		fs::create_directories(full);
		return full;
	}

private:
	fs::path m_path;
};

// Lists through std::filesystem but fails chosen directories with a chosen error.
class FaultyLister : public IDirectoryLister
{
public:
	void fail(const fs::path& directory, std::errc error)
	{
		m_failures[directory.lexically_normal().string()] = std::make_error_code(error);
	}

	std::vector<fs::path> list(const fs::path& directory, std::error_code& ec) override
	{
		auto it = m_failures.find(directory.lexically_normal().string());
		if (it != m_failures.end())
		{
			ec = it->second;
			return {};
		}
		return m_real.list(directory, ec);
	}

private:
	DirectoryLister m_real;
	std::map<std::string, std::error_code> m_failures;
};

// Routes log lines into a vector for the lifetime of the object.
class LogCapture
{
public:
	LogCapture()
	{
		Logger::instance().setSink([this](LogLevel level, const std::string& line)
			{
				if (level >= LogLevel::Warn)
				{
					m_lines.push_back(line);
				}
			});
	}

	~LogCapture()
	{
		Logger::instance().resetSink();
	}

	LogCapture(const LogCapture&) = delete;
	LogCapture& operator=(const LogCapture&) = delete;

	const std::vector<std::string>& lines() const { return m_lines; }

	bool contains(const std::string& text) const
	{
		for (const auto& line : m_lines)
		{
			if (line.find(text) != std::string::npos)
			{
				return true;
			}
		}
		return false;
	}

private:
	std::vector<std::string> m_lines;
};
