#include "log.h"

#include "spdlog/sinks/base_sink.h"
#include "spdlog/sinks/rotating_file_sink.h"
#include "spdlog/sinks/stdout_color_sinks.h"

#include <filesystem>
#include <iostream>
#include <mutex>
#include <vector>

#include <unistd.h>

namespace DocPack
{
namespace details
{
// flush the default logger on exit
struct LogGuard {
    ~LogGuard() {
        Logger::Release();
    }
};

bool PrepareLogdir(const std::string& logPath) {
    std::error_code ec;
    std::filesystem::create_directories(logPath, ec);
    if (ec || !std::filesystem::is_directory(logPath)) {
        std::cerr << "create directory " << logPath << " failed:" << ec.message() << std::endl;
        return false;
    }
    return true;
}

// hands every formatted message to the user's catch handler
class CatchLogSink final : public spdlog::sinks::base_sink<std::mutex> {
public:
    explicit CatchLogSink(LogMessageCatchFunc catcher) : m_catcher(std::move(catcher)) {
    }

protected:
    void sink_it_(const spdlog::details::log_msg& msg) override {
        if (!m_catcher) return;
        spdlog::memory_buf_t formatted;
        formatter_->format(msg, formatted);
        m_catcher(static_cast<LogLevel>(msg.level), formatted.data(), formatted.size());
    }

    void flush_() override {
    }

private:
    LogMessageCatchFunc m_catcher;
};
} // namespace details

// init static resource
Logger* Logger::s_defaultLogger = new Logger();
static details::LogGuard s_guard;

Logger::Logger(const std::string_view& format_str) :
loggerStorage(std::make_shared<spdlog::logger>(Logger::LoggerInitOptions::kDefaultCustomLoggerName,
                                               std::make_shared<spdlog::sinks::stdout_color_sink_mt>())) {
    loggerStorage->set_level(spdlog::level::level_enum::trace);
    if (!format_str.empty()) loggerStorage->set_pattern(std::string(format_str));
}

Logger::~Logger() {
    if (loggerStorage) loggerStorage->flush();
}

void Logger::Initialize(LoggerInitOptions options, Logger* logger) {
    try {
        std::vector<spdlog::sink_ptr> sinks;
        if (options.enableConsoleOutput) {
            sinks.emplace_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        }
        std::string fileName;
        auto logOutputPath = options.logOutputPath.value_or(LoggerInitOptions::kDefaultLogOutputPath);
        auto logOutputProgramName =
            options.logOutputProgramName.value_or(LoggerInitOptions::kDefaultLogOutputProgramName);
        if (!logOutputPath.empty() && !logOutputProgramName.empty() && details::PrepareLogdir(logOutputPath)) {
            fileName = logOutputPath + "/" + logOutputProgramName + "_" + std::to_string(::getpid()) +
                       options.logOutputFileExt.value_or(LoggerInitOptions::kDefaultLogOutputFileExt);
        }
        if (!fileName.empty()) {
            sinks.emplace_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                fileName, options.logFileLimitSize.value_or(LoggerInitOptions::kDefaultLogFileLimitSize),
                options.maxLogFiles.value_or(LoggerInitOptions::kDefaultMaxLogFiles)));
        }
        if (options.catchHandler) {
            sinks.emplace_back(std::make_shared<details::CatchLogSink>(options.catchHandler));
        }
        auto prefer_log_level = options.minimumLevel.value_or(LoggerInitOptions::kDefaultLogLevel);
        if (sinks.empty()) {
            prefer_log_level = LogLevel::off;
        }
        if (logger->loggerStorage) logger->loggerStorage->flush();
        logger->loggerStorage = std::make_shared<spdlog::logger>(
            options.loggerName.empty() ? LoggerInitOptions::kDefaultCustomLoggerName : options.loggerName,
            sinks.begin(), sinks.end());
        logger->loggerStorage->set_level(static_cast<spdlog::level::level_enum>(prefer_log_level));
        logger->loggerStorage->set_pattern(options.logFormat.value_or(LoggerInitOptions::kDefaultLogFormat));
        if (options.errorHandler) {
            logger->loggerStorage->set_error_handler(options.errorHandler);
        }
        logger->errorHandler = options.errorHandler;
    } catch (const std::exception& e) {
        std::cerr << " log initialize failed!" << e.what() << std::endl;
    }
}

void Logger::Release(Logger* logger) {
    if (logger && logger->loggerStorage) logger->loggerStorage->flush();
}

LoggerStream::LoggerStream(Logger* logger, LogLevel level) : loggerRef(logger), level_(level) {
}
LoggerStream::LoggerStream(Logger* logger,
                           LogLevel level,
                           const char* fileName,
                           const char* funcName,
                           std::int32_t line) : loggerRef(logger), level_(level) {
    ss_ << DocPack::StringFormat("[{}:{}({})] ", fileName, funcName, line);
}
LoggerStream::~LoggerStream() {
#ifndef DISABLE_DPLOG
    loggerRef->LogOutput(level_, ss_.str());
#endif
}
} // namespace DocPack
