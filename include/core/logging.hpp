#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

namespace screw_planner::logging {

enum class LogLevel {
    Trace = spdlog::level::trace,
    Debug = spdlog::level::debug,
    Info = spdlog::level::info,
    Warning = spdlog::level::warn,
    Error = spdlog::level::err,
    Critical = spdlog::level::critical,
    Off = spdlog::level::off
};

/// Parse "trace", "debug", "info", "warning", "error", "critical" or "off"
/// (case-insensitive). Unknown strings map to Info.
LogLevel logLevelFromString(const std::string& str);

std::string toString(LogLevel level);

struct LogConfig {
    LogLevel level = LogLevel::Info;
    /// Empty keeps output on stderr only
    std::filesystem::path logDirectory;
    std::string fileName = "screw_planner.log";
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v";
    size_t maxFileSize = 5 * 1024 * 1024;  // 5 MB
    size_t maxFiles = 3;
};

/**
 * @brief Named spdlog loggers sharing one set of sinks
 *
 * Every component logger writes to stderr and, when a log directory is
 * configured, to a single rotating file. configure() rebinds loggers that
 * already exist, so function-local loggers created before the command line
 * is parsed still follow the final level and destination.
 */
class LoggerFactory {
public:
    static std::shared_ptr<spdlog::logger> create(const std::string& name);

    static void configure(const LogConfig& config);

    static void setGlobalLevel(LogLevel level);

    static LogLevel getGlobalLevel();

    /// Active log file, or an empty path when file logging is off
    static std::filesystem::path logFilePath();

    static void shutdown();

private:
    static std::vector<spdlog::sink_ptr> buildSinks(const LogConfig& config);

    static LogConfig config_;
    static std::vector<spdlog::sink_ptr> sinks_;
};

}  // namespace screw_planner::logging
