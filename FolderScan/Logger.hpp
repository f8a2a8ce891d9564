#pragma once

#include <chrono>
#include <ctime>
#include <cstdarg>
#include <cstdio>
#include <fstream>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>

enum class LogLevel { Debug = 0, Info, Warn, Error };

class Logger
{
public:
    using Sink = std::function<void(LogLevel, const std::string&)>;

    static Logger& instance()
    {
        static Logger inst;
        return inst;
    }

    void init(const std::string& filename = "", LogLevel minLevel = LogLevel::Info)
    {
        std::lock_guard<std::mutex> lk(mutex_);
        minLevel_ = minLevel;
        if (file_.is_open())
        {
            file_.close();
        }
        if (!filename.empty())
        {
            file_.open(filename, std::ios::out | std::ios::app);
        }
    }

    void setMinLevel(LogLevel lvl)
    {
        std::lock_guard<std::mutex> lk(mutex_);
        minLevel_ = lvl;
    }

    LogLevel minLevel()
    {
        std::lock_guard<std::mutex> lk(mutex_);
        return minLevel_;
    }

    // Replaces console output. The log file, if any, still receives every line.
    void setSink(Sink sink)
    {
        std::lock_guard<std::mutex> lk(mutex_);
        sink_ = std::move(sink);
    }

    void resetSink()
    {
        std::lock_guard<std::mutex> lk(mutex_);
        sink_ = nullptr;
    }

    void log(LogLevel lvl, const char* file, int line, const char* func, const char* fmt, ...) {
        {
            std::lock_guard<std::mutex> lk(mutex_);
            if (lvl < minLevel_) return;
        }

        va_list args;
        va_start(args, fmt);
        std::string message = format(fmt, args);
        va_end(args);

        auto ts = nowString();
        const char* levelStr = levelToString(lvl);

        std::ostringstream oss;
        oss << ts << " [" << levelStr << "] "
            << baseName(file) << ":" << line << " (" << func << ") - " << message << "\n";

        std::string out = oss.str();

        Sink sink;
        {
            std::lock_guard<std::mutex> lk(mutex_);
            sink = sink_;
            if (file_.is_open()) {
                file_ << out;
                file_.flush();
            }
        }

        // called unlocked, a sink may log itself
        if (sink) {
            sink(lvl, out);
        }
        else {
            std::fwrite(out.data(), 1, out.size(), stderr);
            fflush(stderr);
        }
    }

    static const char* levelToString(LogLevel l) {
        switch (l) {
        case LogLevel::Debug: return "DBG";
        case LogLevel::Info:  return "INF";
        case LogLevel::Warn:  return "WRN";
        case LogLevel::Error: return "ERR";
        default: return "UNK";
        }
    }

private:
#ifdef _DEBUG
    Logger() : minLevel_(LogLevel::Debug) {}
#else
    Logger() : minLevel_(LogLevel::Info) {}
#endif
    ~Logger()
    {
        if (file_.is_open()) file_.close();
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::string nowString() {
        using namespace std::chrono;
        auto t = system_clock::now();
        auto tt = system_clock::to_time_t(t);
        auto ms = duration_cast<milliseconds>(t.time_since_epoch()) % 1000;

        std::tm tm_buf;
#if defined(_WIN32)
        localtime_s(&tm_buf, &tt);
#else
        localtime_r(&tt, &tm_buf);
#endif
        char buf[64];
        std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d %02d:%02d:%02d.%03d",
            tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
            tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec, static_cast<int>(ms.count()));
        return std::string(buf);
    }

    static std::string format(const char* fmt, va_list args) {
        va_list sizing;
        va_copy(sizing, args);
        int length = vsnprintf(nullptr, 0, fmt, sizing);
        va_end(sizing);
        if (length <= 0) {
            return std::string();
        }

        std::string text(static_cast<std::size_t>(length) + 1, '\0');
        vsnprintf(&text[0], text.size(), fmt, args);
        text.resize(static_cast<std::size_t>(length));
        return text;
    }

    static const char* baseName(const char* path) {
        const char* name = path;
        for (const char* p = path; *p; ++p) {
            if (*p == '/' || *p == '\\') name = p + 1;
        }
        return name;
    }

    std::mutex mutex_;
    std::ofstream file_;
    LogLevel minLevel_;
    Sink sink_;
};

#define LOG(level, fmt, ...) \
        do { Logger::instance().log(LogLevel::level, __FILE__, __LINE__, __func__, (fmt), ##__VA_ARGS__); } while(0)
