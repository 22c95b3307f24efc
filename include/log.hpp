#pragma once

#include <filesystem>
#include <string>

namespace termamp {

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error
};

void set_log_level(LogLevel level);
LogLevel log_level();

// Redirects log output to a file. Returns false and keeps logging to stderr
// when the file cannot be opened.
bool set_log_file(const std::filesystem::path &path);

void log(LogLevel level, const std::string &message);

inline void log_debug(const std::string &message) { log(LogLevel::Debug, message); }
inline void log_info(const std::string &message) { log(LogLevel::Info, message); }
inline void log_warning(const std::string &message) { log(LogLevel::Warning, message); }
inline void log_error(const std::string &message) { log(LogLevel::Error, message); }

}
