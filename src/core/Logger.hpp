#pragma once
#include <filesystem>
#include <fstream>
#include <string>

enum class LogLevel { Debug, Info, Warning, Error };

// Append-only event log, one record per line:
//   2025-01-31 12:00:00 - ERROR - Dispatcher.cpp:88 - message
class Logger {
public:
    // Opens (or creates) the file for appending; throws FatalError on failure.
    explicit Logger(const std::filesystem::path& file);

    void log(LogLevel level, const char* file, int line, const std::string& message);
    void set_min_level(LogLevel level) { min_level_ = level; }

    static const char* level_name(LogLevel level);
private:
    std::filesystem::path path_;
    std::ofstream out_;
    LogLevel min_level_ = LogLevel::Debug;
};

#define GTOS_LOG_DEBUG(logger, msg) (logger).log(LogLevel::Debug, __FILE__, __LINE__, (msg))
#define GTOS_LOG_INFO(logger, msg) (logger).log(LogLevel::Info, __FILE__, __LINE__, (msg))
#define GTOS_LOG_WARN(logger, msg) (logger).log(LogLevel::Warning, __FILE__, __LINE__, (msg))
#define GTOS_LOG_ERROR(logger, msg) (logger).log(LogLevel::Error, __FILE__, __LINE__, (msg))
