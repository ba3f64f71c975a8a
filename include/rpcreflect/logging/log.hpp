#pragma once

/// @file rpcreflect/logging/log.hpp
/// @brief Logging macros and default logger setup
///
/// @code
/// LOG_INFO() << "Indexed " << files << " files";
/// @endcode

#include <memory>
#include <sstream>
#include <string>

#include <rpcreflect/logging/level.hpp>

namespace spdlog {
class logger;
}  // namespace spdlog

RPCREFLECT_NAMESPACE_BEGIN

namespace logging {

using LoggerPtr = std::shared_ptr<spdlog::logger>;

/// Logger writing tskv lines to stderr
LoggerPtr MakeStderrLogger(const std::string& name);

/// Logger appending tskv lines to the file at `path`
LoggerPtr MakeFileLogger(const std::string& name, const std::string& path);

/// Replaces the logger used by LOG_* macros, keeping the current level
void SetDefaultLogger(LoggerPtr logger);

LoggerPtr GetDefaultLogger();

void SetDefaultLoggerLevel(Level level);

Level GetDefaultLoggerLevel() noexcept;

/// Whether a message of the given level passes the default logger filter
bool ShouldLog(Level level) noexcept;

/// Flushes the default logger
void LogFlush();

/// @brief Accumulates a single log record and writes it to the default logger on destruction
class LogHelper final {
public:
    LogHelper(Level level, const char* path, int line, const char* func) noexcept;
    ~LogHelper();

    LogHelper(LogHelper&&) = delete;
    LogHelper& operator=(LogHelper&&) = delete;

    template <typename T>
    LogHelper& operator<<(const T& value) {
        stream_ << value;
        return *this;
    }

    LogHelper& AsLvalue() noexcept { return *this; }

private:
    const Level level_;
    const char* const path_;
    const int line_;
    const char* const func_;
    std::ostringstream stream_;
};

}  // namespace logging

RPCREFLECT_NAMESPACE_END

/// @brief Builds a stream and evaluates a message if the logger accepts `lvl`
#define LOG(lvl)                                                                            \
    for (bool rpcreflect_impl_should_log = RPCREFLECT_NAMESPACE::logging::ShouldLog(lvl);   \
         rpcreflect_impl_should_log;                                                        \
         rpcreflect_impl_should_log = false)                                                \
    RPCREFLECT_NAMESPACE::logging::LogHelper(lvl, __FILE__, __LINE__, __func__).AsLvalue()

#define LOG_TRACE() LOG(RPCREFLECT_NAMESPACE::logging::Level::kTrace)
#define LOG_DEBUG() LOG(RPCREFLECT_NAMESPACE::logging::Level::kDebug)
#define LOG_INFO() LOG(RPCREFLECT_NAMESPACE::logging::Level::kInfo)
#define LOG_WARNING() LOG(RPCREFLECT_NAMESPACE::logging::Level::kWarning)
#define LOG_ERROR() LOG(RPCREFLECT_NAMESPACE::logging::Level::kError)
#define LOG_CRITICAL() LOG(RPCREFLECT_NAMESPACE::logging::Level::kCritical)
