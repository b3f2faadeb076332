#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace dicom_organizer::logging {

enum class LogLevel {
    Trace = spdlog::level::trace,
    Debug = spdlog::level::debug,
    Info = spdlog::level::info,
    Warning = spdlog::level::warn,
    Error = spdlog::level::err,
    Critical = spdlog::level::critical,
    Off = spdlog::level::off
};

struct LogConfig {
    LogLevel level = LogLevel::Info;
    bool enableFileLogging = false;
    std::filesystem::path logDirectory;
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v";
    size_t maxFileSize = 5 * 1024 * 1024;  // 5 MB
    size_t maxFiles = 3;
};

/// Configuration-file name of a level ("trace" ... "off")
std::string to_string(LogLevel level);

/// Parse a configuration-file level name; unknown names map to Info
LogLevel logLevelFromString(const std::string& name);

class LoggerFactory {
public:
    /// Get or create the named logger with the configured sinks
    static std::shared_ptr<spdlog::logger> create(const std::string& name);

    static void configure(const LogConfig& config);

    static void setGlobalLevel(LogLevel level);

    static LogLevel getGlobalLevel();

    static bool isConfigured();

    static void shutdown();

private:
    static LogConfig config_;
    static bool configured_;
};

}  // namespace dicom_organizer::logging
