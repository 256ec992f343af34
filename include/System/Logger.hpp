#pragma once
#include <cstddef>
#include <cstdio>
#include <exception>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "spdlog/spdlog.h"
#include "spdlog/sinks/rotating_file_sink.h"
#include "spdlog/sinks/stdout_color_sinks.h"

struct LoggerConfig {
    std::string name = "agenthive";
    std::string filePath = "logs/agenthive.log";
    spdlog::level::level_enum consoleLevel = spdlog::level::info;
    spdlog::level::level_enum fileLevel = spdlog::level::trace;
    std::size_t rotationSize = 5 * 1024 * 1024;
    std::size_t maxFiles = 3;
    bool enableConsole = true;
    bool enableFile = true;
};

class SafeLogger {
    inline static std::shared_ptr<spdlog::logger> instance;
    inline static LoggerConfig lazyConfig;
    inline static std::mutex mtx;

public:
    static void initialize(const LoggerConfig& config = LoggerConfig()) {
        std::lock_guard lock(mtx);
        if (instance) return;

        std::vector<spdlog::sink_ptr> sinks;
        if (config.enableConsole) {
            auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console->set_level(config.consoleLevel);
            sinks.push_back(console);
        }
        if (config.enableFile) {
            auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.filePath, config.rotationSize, config.maxFiles);
            file->set_level(config.fileLevel);
            sinks.push_back(file);
        }

        instance = std::make_shared<spdlog::logger>(config.name, sinks.begin(), sinks.end());
        instance->set_level(spdlog::level::trace);
        instance->flush_on(spdlog::level::info);
        spdlog::set_default_logger(instance);
    }

    // Drops the current logger so the next initialize() applies a new config.
    static void reset() {
        std::lock_guard lock(mtx);
        if (instance) instance->flush();
        instance.reset();
    }

    // Config used when the logger is first needed without an explicit initialize().
    static void setDefaultConfig(const LoggerConfig& config) {
        std::lock_guard lock(mtx);
        lazyConfig = config;
    }

    static std::shared_ptr<spdlog::logger> get() {
        LoggerConfig config;
        {
            std::lock_guard lock(mtx);
            if (instance) return instance;
            config = lazyConfig;
        }
        initialize(config);
        std::lock_guard lock(mtx);
        return instance;
    }
};

#define AH_LOG_TRACE(...)    SafeLogger::get()->trace(__VA_ARGS__)
#define AH_LOG_DEBUG(...)    SafeLogger::get()->debug(__VA_ARGS__)
#define AH_LOG_INFO(...)     SafeLogger::get()->info(__VA_ARGS__)
#define AH_LOG_WARN(...)     SafeLogger::get()->warn(__VA_ARGS__)
#define AH_LOG_ERROR(...)    SafeLogger::get()->error(__VA_ARGS__)
#define AH_LOG_CRITICAL(...) SafeLogger::get()->critical(__VA_ARGS__)

// For noexcept paths: a logger that cannot be set up reports to stderr instead.
#define AH_LOG_NOTHROW(level, ...)                                           \
    do {                                                                     \
        try {                                                                \
            SafeLogger::get()->level(__VA_ARGS__);                           \
        } catch (const std::exception& ah_log_error) {                       \
            std::fprintf(stderr, "logger unavailable: %s\n", ah_log_error.what()); \
        }                                                                    \
    } while (0)
