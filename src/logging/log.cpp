#include <rpcreflect/logging/log.hpp>

#include <atomic>
#include <iostream>
#include <memory>
#include <string_view>
#include <utility>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>

RPCREFLECT_NAMESPACE_BEGIN

namespace logging {

namespace {

constexpr std::string_view kTskvPattern =
    "tskv\ttimestamp=%Y-%m-%dT%H:%M:%S.%f\tlevel=%l\tmodule=%! ( %s:%# )\ttext=%v";

std::atomic<Level> default_level{Level::kInfo};

spdlog::level::level_enum ToSpdlogLevel(Level level) noexcept {
    switch (level) {
        case Level::kTrace:
            return spdlog::level::trace;
        case Level::kDebug:
            return spdlog::level::debug;
        case Level::kInfo:
            return spdlog::level::info;
        case Level::kWarning:
            return spdlog::level::warn;
        case Level::kError:
            return spdlog::level::err;
        case Level::kCritical:
            return spdlog::level::critical;
        case Level::kNone:
            return spdlog::level::off;
    }
    return spdlog::level::off;
}

LoggerPtr Setup(LoggerPtr logger) {
    logger->set_pattern(std::string{kTskvPattern});
    logger->set_level(ToSpdlogLevel(default_level.load()));
    return logger;
}

}  // namespace

LoggerPtr MakeStderrLogger(const std::string& name) {
    return Setup(std::make_shared<spdlog::logger>(name, std::make_shared<spdlog::sinks::stderr_sink_mt>()));
}

LoggerPtr MakeFileLogger(const std::string& name, const std::string& path) {
    return Setup(std::make_shared<spdlog::logger>(name, std::make_shared<spdlog::sinks::basic_file_sink_mt>(path)));
}

void SetDefaultLogger(LoggerPtr logger) {
    logger->set_level(ToSpdlogLevel(default_level.load()));
    spdlog::set_default_logger(std::move(logger));
}

LoggerPtr GetDefaultLogger() { return spdlog::default_logger(); }

void SetDefaultLoggerLevel(Level level) {
    default_level = level;
    spdlog::default_logger_raw()->set_level(ToSpdlogLevel(level));
}

Level GetDefaultLoggerLevel() noexcept { return default_level.load(); }

bool ShouldLog(Level level) noexcept { return level != Level::kNone && level >= default_level.load(); }

void LogFlush() { spdlog::default_logger_raw()->flush(); }

LogHelper::LogHelper(Level level, const char* path, int line, const char* func) noexcept
    : level_(level), path_(path), line_(line), func_(func) {}

LogHelper::~LogHelper() {
    try {
        spdlog::default_logger_raw()->log(
            spdlog::source_loc{path_, line_, func_}, ToSpdlogLevel(level_), "{}", stream_.str()
        );
    } catch (const std::exception& ex) {
        std::cerr << "Failed to write a log record: " << ex.what() << '\n';
    }
}

}  // namespace logging

RPCREFLECT_NAMESPACE_END
