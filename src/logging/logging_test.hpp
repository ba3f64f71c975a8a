#pragma once

#include <memory>
#include <sstream>
#include <string>

#include <gtest/gtest.h>
#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

#include <rpcreflect/logging/log.hpp>

RPCREFLECT_NAMESPACE_BEGIN

/// Redirects the default logger into a string stream for the duration of a test
class LoggingTest : public ::testing::Test {
protected:
    void SetUp() override {
        old_logger_ = logging::GetDefaultLogger();
        old_level_ = logging::GetDefaultLoggerLevel();

        auto logger =
            std::make_shared<spdlog::logger>("test", std::make_shared<spdlog::sinks::ostream_sink_mt>(sstream_));
        logger->set_pattern("level=%l\ttext=%v");
        logging::SetDefaultLogger(std::move(logger));
    }

    void TearDown() override {
        logging::SetDefaultLogger(old_logger_);
        logging::SetDefaultLoggerLevel(old_level_);
    }

    std::string GetStreamString() const { return sstream_.str(); }

    void ClearLog() { sstream_.str({}); }

private:
    std::ostringstream sstream_;
    logging::LoggerPtr old_logger_;
    logging::Level old_level_{logging::Level::kInfo};
};

RPCREFLECT_NAMESPACE_END
