#include "log.hpp"

#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>

namespace termamp {

namespace {

std::mutex log_mutex;
std::ofstream log_stream;
LogLevel min_level = LogLevel::Info;

const char *level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:   return "debug";
        case LogLevel::Info:    return "info";
        case LogLevel::Warning: return "warning";
        case LogLevel::Error:   return "error";
    }
    return "?";
}

}

void set_log_level(LogLevel level) {
    std::lock_guard lock(log_mutex);
    min_level = level;
}

LogLevel log_level() {
    std::lock_guard lock(log_mutex);
    return min_level;
}

bool set_log_file(const std::filesystem::path &path) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
    }

    std::lock_guard lock(log_mutex);
    if (log_stream.is_open()) {
        log_stream.close();
    }
    log_stream.open(path, std::ios::app);
    if (!log_stream) {
        std::cerr << "Failed to open log file: " << path << std::endl;
        return false;
    }
    return true;
}

void log(LogLevel level, const std::string &message) {
    std::lock_guard lock(log_mutex);
    if (level < min_level) {
        return;
    }

    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    localtime_r(&now, &local);

    std::ostream &out = log_stream.is_open() ? static_cast<std::ostream &>(log_stream) : std::cerr;
    out << std::put_time(&local, "%H:%M:%S") << " [" << level_name(level) << "] " << message << '\n';
    out.flush();
}

}
