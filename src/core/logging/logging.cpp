#include "core/logging.hpp"

#include <algorithm>
#include <cctype>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace screw_planner::logging {

LogConfig LoggerFactory::config_ = {};
std::vector<spdlog::sink_ptr> LoggerFactory::sinks_;

namespace {

spdlog::level::level_enum toSpdlog(LogLevel level) {
    return static_cast<spdlog::level::level_enum>(level);
}

}  // namespace

LogLevel logLevelFromString(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") return LogLevel::Trace;
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "warning" || lower == "warn") return LogLevel::Warning;
    if (lower == "error") return LogLevel::Error;
    if (lower == "critical") return LogLevel::Critical;
    if (lower == "off") return LogLevel::Off;
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

std::vector<spdlog::sink_ptr> LoggerFactory::buildSinks(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    // stderr keeps the CLI's stdout for the written path
    auto consoleSink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    consoleSink->set_level(toSpdlog(config.level));
    sinks.push_back(consoleSink);

    if (!config.logDirectory.empty()) {
        auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            (config.logDirectory / config.fileName).string(),
            config.maxFileSize,
            config.maxFiles
        );
        fileSink->set_level(toSpdlog(config.level));
        sinks.push_back(fileSink);
    }
    return sinks;
}

std::shared_ptr<spdlog::logger> LoggerFactory::create(const std::string& name) {
    auto existingLogger = spdlog::get(name);
    if (existingLogger) {
        return existingLogger;
    }

    if (sinks_.empty()) {
        sinks_ = buildSinks(config_);
    }

    auto logger = std::make_shared<spdlog::logger>(name, sinks_.begin(), sinks_.end());
    logger->set_level(toSpdlog(config_.level));
    logger->set_pattern(config_.pattern);

    spdlog::register_logger(logger);

    return logger;
}

void LoggerFactory::configure(const LogConfig& config) {
    // Throws spdlog_ex if the log file cannot be opened; nothing changes then
    auto sinks = buildSinks(config);

    config_ = config;
    sinks_ = std::move(sinks);

    spdlog::set_level(toSpdlog(config_.level));
    spdlog::apply_all([](std::shared_ptr<spdlog::logger> logger) {
        logger->sinks() = sinks_;
        logger->set_level(toSpdlog(config_.level));
        logger->set_pattern(config_.pattern);
    });
}

void LoggerFactory::setGlobalLevel(LogLevel level) {
    config_.level = level;
    spdlog::set_level(toSpdlog(level));

    for (auto& sink : sinks_) {
        sink->set_level(toSpdlog(level));
    }
    spdlog::apply_all([level](std::shared_ptr<spdlog::logger> logger) {
        logger->set_level(toSpdlog(level));
    });
}

LogLevel LoggerFactory::getGlobalLevel() {
    return config_.level;
}

std::filesystem::path LoggerFactory::logFilePath() {
    if (config_.logDirectory.empty()) {
        return {};
    }
    return config_.logDirectory / config_.fileName;
}

void LoggerFactory::shutdown() {
    spdlog::shutdown();
    sinks_.clear();
    config_ = LogConfig{};
}

}  // namespace screw_planner::logging
