#include "Logger.hpp"
#include "Errors.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>
#include <system_error>

Logger::Logger(const std::filesystem::path& file) : path_(file) {
    std::error_code ec;
    if (path_.has_parent_path()) std::filesystem::create_directories(path_.parent_path(), ec);
    out_.open(path_, std::ios::out | std::ios::app);
    if (!out_) throw FatalError("cannot open log file: " + path_.string());
}

const char* Logger::level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warning: return "WARNING";
        case LogLevel::Error: return "ERROR";
    }
    return "INFO";
}

void Logger::log(LogLevel level, const char* file, int line, const std::string& message) {
    if (level < min_level_) return;
    std::time_t now = std::time(nullptr);
    std::tm tm{};
    localtime_r(&now, &tm);
    std::string source = std::filesystem::path(file ? file : "?").filename().string();
    out_ << std::put_time(&tm, "%Y-%m-%d %H:%M:%S")
         << " - " << level_name(level)
         << " - " << source << ':' << line
         << " - " << message << '\n';
    out_.flush();
}
