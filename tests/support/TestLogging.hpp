#pragma once

#include "System/Logger.hpp"

// Console-only logging at warn.
inline LoggerConfig testLoggerConfig() {
    LoggerConfig config;
    config.name = "agenthive-tests";
    config.enableFile = false;
    config.consoleLevel = spdlog::level::warn;
    return config;
}

// Applied once for every test binary that includes this header.
inline const bool kTestLoggingConfigured = [] {
    SafeLogger::setDefaultConfig(testLoggerConfig());
    SafeLogger::initialize(testLoggerConfig());
    return true;
}();
