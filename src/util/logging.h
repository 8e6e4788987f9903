#pragma once

#include <format>
#include <mutex>
#include <source_location>
#include <string>
#include <string_view>

namespace stratum::util
{
    enum class LogLevel
    {
        kDebug,
        kInfo,
        kWarn,
        kError
    };

    bool ParseLogLevel(std::string_view text, LogLevel *out);

    /**
     * @brief Process-wide logger.
     * Use STRATUM_LOG_* macros for automatic file/line capture. Lines go to
     * stderr and, when a file is set, are appended there as well.
     */
    class Logger
    {
    public:
        static Logger &Instance();

        void SetLevel(LogLevel level);
        LogLevel GetLevel() const;
        void SetFile(std::string path);

        template <typename... Args>
        void Log(LogLevel level, std::source_location loc, std::string_view fmt, Args &&...args)
        {
            if (level < GetLevel())
                return;

            std::string message;
            try
            {
                message = std::vformat(fmt, std::make_format_args(args...));
            }
            catch (const std::format_error &)
            {
                message = std::string(fmt);
            }
            Write(level, loc, message);
        }

    private:
        Logger();
        void Write(LogLevel level, std::source_location loc, const std::string &message);

        mutable std::mutex mutex_;
        LogLevel min_level_;
        std::string file_path_;
    };

} // namespace stratum::util

// ── Macros ──────────────────────────────────────────────────────────────────

#define STRATUM_LOG_DEBUG(fmt, ...) \
    ::stratum::util::Logger::Instance().Log(::stratum::util::LogLevel::kDebug, std::source_location::current(), fmt, ##__VA_ARGS__)

#define STRATUM_LOG_INFO(fmt, ...) \
    ::stratum::util::Logger::Instance().Log(::stratum::util::LogLevel::kInfo, std::source_location::current(), fmt, ##__VA_ARGS__)

#define STRATUM_LOG_WARN(fmt, ...) \
    ::stratum::util::Logger::Instance().Log(::stratum::util::LogLevel::kWarn, std::source_location::current(), fmt, ##__VA_ARGS__)

#define STRATUM_LOG_ERROR(fmt, ...) \
    ::stratum::util::Logger::Instance().Log(::stratum::util::LogLevel::kError, std::source_location::current(), fmt, ##__VA_ARGS__)
