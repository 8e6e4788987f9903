#include "util/logging.h"

#include <chrono>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace stratum::util
{
    bool ParseLogLevel(std::string_view s, LogLevel *out)
    {
        if (s == "DEBUG" || s == "debug")
            *out = LogLevel::kDebug;
        else if (s == "INFO" || s == "info")
            *out = LogLevel::kInfo;
        else if (s == "WARN" || s == "warn")
            *out = LogLevel::kWarn;
        else if (s == "ERROR" || s == "error")
            *out = LogLevel::kError;
        else
            return false;
        return true;
    }

    Logger::Logger() : min_level_(LogLevel::kInfo)
    {
        const char *env = std::getenv("STRATUM_LOG_LEVEL");
        if (env)
        {
            LogLevel lvl;
            if (ParseLogLevel(env, &lvl))
                min_level_ = lvl;
        }
    }

    Logger &Logger::Instance()
    {
        static Logger instance;
        return instance;
    }

    void Logger::SetLevel(LogLevel level)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        min_level_ = level;
    }

    LogLevel Logger::GetLevel() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return min_level_;
    }

    void Logger::SetFile(std::string path)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        file_path_ = std::move(path);
    }

    void Logger::Write(LogLevel level, std::source_location loc, const std::string &message)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        auto now = std::chrono::system_clock::now();
        auto in_time_t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
        std::tm tm_buf{};
        localtime_r(&in_time_t, &tm_buf);

        const char *level_str = "";
        switch (level)
        {
        case LogLevel::kDebug:
            level_str = "DEBUG";
            break;
        case LogLevel::kInfo:
            level_str = "INFO ";
            break;
        case LogLevel::kWarn:
            level_str = "WARN ";
            break;
        case LogLevel::kError:
            level_str = "ERROR";
            break;
        }

        std::ostringstream line;
        line << "[" << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
             << "." << std::setfill('0') << std::setw(3) << ms.count() << "] "
             << level_str << " "
             << "[" << std::filesystem::path(loc.file_name()).filename().string() << ":" << loc.line() << "] "
             << message << "\n";

        std::cerr << line.str();
        if (!file_path_.empty())
        {
            std::ofstream out(file_path_, std::ios::app);
            if (out)
                out << line.str();
        }
    }

} // namespace stratum::util
