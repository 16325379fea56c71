#include "core/logging.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <system_error>
#include <vector>

namespace tomo_viewer::logging {

LogConfig LoggerFactory::config_ = {};

LogLevel logLevelFromString(std::string_view name) {
    if (name == "trace") return LogLevel::Trace;
    if (name == "debug") return LogLevel::Debug;
    if (name == "warning" || name == "warn") return LogLevel::Warning;
    if (name == "error") return LogLevel::Error;
    if (name == "critical") return LogLevel::Critical;
    if (name == "off") return LogLevel::Off;
    return LogLevel::Info;
}

std::string toString(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "trace";
        case LogLevel::Debug:    return "debug";
        case LogLevel::Info:     return "info";
        case LogLevel::Warning:  return "warning";
        case LogLevel::Error:    return "error";
        case LogLevel::Critical: return "critical";
        case LogLevel::Off:      return "off";
    }
    return "info";
}

std::shared_ptr<spdlog::logger> LoggerFactory::create(const std::string& name) {
    auto existingLogger = spdlog::get(name);
    if (existingLogger) {
        return existingLogger;
    }

    std::vector<spdlog::sink_ptr> sinks;

    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    consoleSink->set_level(static_cast<spdlog::level::level_enum>(config_.level));
    sinks.push_back(consoleSink);

    if (config_.enableFileLogging && !config_.logDirectory.empty()) {
        auto logFile = config_.logDirectory / (name + ".log");
        auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            logFile.string(),
            config_.maxFileSize,
            config_.maxFiles
        );
        fileSink->set_level(static_cast<spdlog::level::level_enum>(config_.level));
        sinks.push_back(fileSink);
    }

    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(static_cast<spdlog::level::level_enum>(config_.level));
    logger->set_pattern(config_.pattern);

    // Worker threads may race to create the same logger
    try {
        spdlog::register_logger(logger);
    } catch (const spdlog::spdlog_ex&) {
        if (auto registered = spdlog::get(name)) {
            return registered;
        }
    }

    return logger;
}

void LoggerFactory::configure(const LogConfig& config) {
    config_ = config;

    spdlog::set_level(static_cast<spdlog::level::level_enum>(config.level));
    spdlog::set_pattern(config.pattern);

    if (!config.enableFileLogging || config.logDirectory.empty()) {
        return;
    }

    std::error_code ec;
    std::filesystem::create_directories(config.logDirectory, ec);
    if (ec) {
        spdlog::error("Cannot create log directory {}: {}",
                      config.logDirectory.string(), ec.message());
        return;
    }

    // Loggers created before configure() get their file sink here
    spdlog::apply_all([&config](std::shared_ptr<spdlog::logger> logger) {
        auto& sinks = logger->sinks();
        const bool hasFileSink = std::any_of(sinks.begin(), sinks.end(), [](const auto& sink) {
            return std::dynamic_pointer_cast<spdlog::sinks::rotating_file_sink_mt>(sink) != nullptr;
        });
        if (hasFileSink) {
            return;
        }
        auto logFile = config.logDirectory / (logger->name() + ".log");
        auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            logFile.string(), config.maxFileSize, config.maxFiles);
        fileSink->set_level(static_cast<spdlog::level::level_enum>(config.level));
        fileSink->set_pattern(config.pattern);
        sinks.push_back(fileSink);
    });
}

void LoggerFactory::setGlobalLevel(LogLevel level) {
    config_.level = level;
    spdlog::set_level(static_cast<spdlog::level::level_enum>(level));

    spdlog::apply_all([level](std::shared_ptr<spdlog::logger> logger) {
        logger->set_level(static_cast<spdlog::level::level_enum>(level));
    });
}

LogLevel LoggerFactory::getGlobalLevel() {
    return config_.level;
}

void LoggerFactory::shutdown() {
    spdlog::shutdown();
}

}  // namespace tomo_viewer::logging
