#pragma once
#include "spdlog/spdlog.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>

namespace DocPack
{

enum LogLevel
{
    trace    = 0,
    debug    = 1,
    info     = 2,
    warn     = 3,
    err      = 4,
    critical = 5,
    off      = 6
};
using ErrorHandlerType    = std::function<void(const std::string&)>;
using LogMessageCatchFunc = std::function<void(LogLevel level, const char* /*str*/, std::size_t /*size*/)>;

class Logger {
public:
    struct LoggerInitOptions {
        static constexpr LogLevel kDefaultLogLevel                = LogLevel::info;
        static constexpr const char* kDefaultCustomLoggerName     = "docpack";
        static constexpr const char* kDefaultLogOutputPath        = "logs";
        static constexpr const char* kDefaultLogOutputProgramName = "";
        static constexpr const char* kDefaultLogOutputFileExt     = ".log";
        static constexpr const char* kDefaultLogFormat            = "%^%Y-%m-%d %H:%M:%S.%e %l%$ [thread:%t]: %v";
        static constexpr std::size_t kDefaultLogFileLimitSize     = 10 * 1024 * 1024; // 10M
        static constexpr std::size_t kDefaultMaxLogFiles          = 5;
        std::string loggerName = kDefaultCustomLoggerName;
        // minimum log level
        std::optional<LogLevel> minimumLevel;
        // log output path
        std::optional<std::string> logOutputPath;
        // log output file basename, file output is disabled while it is empty
        std::optional<std::string> logOutputProgramName;
        // log file's ext
        std::optional<std::string> logOutputFileExt;
        // control logs' head format
        std::optional<std::string> logFormat;
        // single log file's limit size, the file rotates when it is reached
        std::optional<std::size_t> logFileLimitSize;
        // number of rotated files kept beside the active one
        std::optional<std::size_t> maxLogFiles;
        // control log to console
        bool enableConsoleOutput = true;
        //
        ErrorHandlerType errorHandler = nullptr;
        // catch all log msg
        LogMessageCatchFunc catchHandler = nullptr;
    };

public:
    Logger(const std::string_view& format_str = "%^[%L]%$ %v");
    ~Logger();

    template <typename T>
    inline void LogOutput(LogLevel level, const T& data) {
        loggerStorage->log(static_cast<spdlog::level::level_enum>(level), data);
    }

    template <typename Arg1, typename... Args>
    inline void LogOutput(LogLevel level, spdlog::format_string_t<Arg1, Args...> fmt, Arg1&& arg1, Args&&... args) {
        loggerStorage->log(static_cast<spdlog::level::level_enum>(level), fmt, std::forward<Arg1>(arg1),
                           std::forward<Args>(args)...);
    }

    bool ShouldLog(LogLevel level) const {
        return loggerStorage && loggerStorage->should_log(static_cast<spdlog::level::level_enum>(level));
    }
    static void Initialize(LoggerInitOptions options, Logger* logger = s_defaultLogger);
    static void Release(Logger* logger = s_defaultLogger);

public:
    static Logger* s_defaultLogger;

private:
    ErrorHandlerType errorHandler;
    std::shared_ptr<spdlog::logger> loggerStorage = nullptr;
};

inline std::string StringFormat() {
    return "";
}

inline std::string StringFormat(std::string_view data) {
    return std::string(data);
}

template <typename Arg1, typename... Args>
inline std::string StringFormat(fmt::format_string<Arg1, Args...> fmt, Arg1&& arg1, Args&&... args) {
    return fmt::format(fmt, std::forward<Arg1>(arg1), std::forward<Args>(args)...);
}

class LoggerStream final {
public:
    explicit LoggerStream(Logger* logger, LogLevel level);
    explicit LoggerStream(Logger* logger,
                          LogLevel level,
                          const char* fileName,
                          const char* funcName,
                          std::int32_t line);
    ~LoggerStream();
    std::stringstream& stream() {
        return ss_;
    }

private:
    Logger* const loggerRef = nullptr;
    const LogLevel level_;
    std::stringstream ss_;
};

namespace details
{
// "/a/b/c/archive_writer.cpp" -> "archive_writer.cpp"
inline constexpr const char* ShortFileName(const char* path) {
    const char* name = path;
    for (const char* p = path; *p != '\0'; ++p) {
        if (*p == '/' || *p == '\\') name = p + 1;
    }
    return name;
}
} // namespace details
} // namespace DocPack

#define DP_STR_H(x)      #x
#define DP_STR_HELPER(x) DP_STR_H(x)
#define DP_LOG_FILE_NAME DocPack::details::ShortFileName(__FILE__)

#ifndef DISABLE_DPLOG
    #define DPLOG(logger, logLevel, ...) (logger)->LogOutput(logLevel, __VA_ARGS__)
    #define DPLOG_DEBUGINFO(logger, logLevel, ...)                                                                     \
        do {                                                                                                           \
            auto __debugInfo__ =                                                                                       \
                DocPack::StringFormat("[{}:{}(" DP_STR_HELPER(__LINE__) ")] ", DP_LOG_FILE_NAME, __func__);            \
            (logger)->LogOutput(logLevel, __debugInfo__ + DocPack::StringFormat(__VA_ARGS__));                         \
        } while (0)
#else
    #define DPLOG(logger, logLevel, ...)           (void)0
    #define DPLOG_DEBUGINFO(logger, logLevel, ...) (void)0
#endif // !DISABLE_DPLOG

#ifdef DEBUG
    #define DPDEBUG(...) DPLOG(DocPack::Logger::s_defaultLogger, DocPack::LogLevel::debug, __VA_ARGS__)
#else
    #define DPDEBUG(...) (void)0
#endif

#ifndef DISABLE_TRACE
    #define DPTRACE(...) DPLOG_DEBUGINFO(DocPack::Logger::s_defaultLogger, DocPack::LogLevel::trace, __VA_ARGS__)
#else
    #define DPTRACE(...) (void)0
#endif

#define DPINFO(...) DPLOG(DocPack::Logger::s_defaultLogger, DocPack::LogLevel::info, __VA_ARGS__)
#define DPERR(...)  DPLOG_DEBUGINFO(DocPack::Logger::s_defaultLogger, DocPack::LogLevel::err, __VA_ARGS__)
#define DPFAIL(...) DPLOG_DEBUGINFO(DocPack::Logger::s_defaultLogger, DocPack::LogLevel::critical, __VA_ARGS__)
#define DPWARN(...) DPLOG_DEBUGINFO(DocPack::Logger::s_defaultLogger, DocPack::LogLevel::warn, __VA_ARGS__)

#define DPINFOS DocPack::LoggerStream(DocPack::Logger::s_defaultLogger, DocPack::LogLevel::info).stream()
#define DPERRS                                                                                                         \
    DocPack::LoggerStream(DocPack::Logger::s_defaultLogger, DocPack::LogLevel::err, DP_LOG_FILE_NAME, __func__,        \
                          __LINE__)                                                                                    \
        .stream()
#define DPWARNS                                                                                                        \
    DocPack::LoggerStream(DocPack::Logger::s_defaultLogger, DocPack::LogLevel::warn, DP_LOG_FILE_NAME, __func__,       \
                          __LINE__)                                                                                    \
        .stream()

#if defined(DEBUG) && !defined(DISABLE_ASSERT)
    #define DPASSERT(_check, ...)                                                                                      \
        if (!(_check)) {                                                                                               \
            auto __debugInfo__ = DocPack::StringFormat("[{}:{}(" DP_STR_HELPER(__LINE__) ")] [####check####:" #_check \
                                                       "] ",                                                           \
                                                       DP_LOG_FILE_NAME, __func__);                                    \
            throw std::runtime_error(__debugInfo__ + DocPack::StringFormat(__VA_ARGS__));                              \
        }
#else
    #define DPASSERT(_check, ...) (void)0
#endif

// add more logger instance
#define DPINFO_I(logger, ...) DPLOG(logger, DocPack::LogLevel::info, __VA_ARGS__)
#define DPERR_I(logger, ...)  DPLOG_DEBUGINFO(logger, DocPack::LogLevel::err, __VA_ARGS__)
#define DPWARN_I(logger, ...) DPLOG_DEBUGINFO(logger, DocPack::LogLevel::warn, __VA_ARGS__)

/*end of file*/
