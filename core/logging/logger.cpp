#include "logger.hpp"
#include <iostream>
#include <chrono>
#include <iomanip>
#include <algorithm>
#include <filesystem>

namespace helm {
namespace logging {

Level Logger::threshold_ = Level::LVL_INFO;
std::mutex Logger::mutex_;
std::ofstream Logger::file_;

namespace {

const char* level_tag(Level level) {
    switch (level) {
        case Level::LVL_DEBUG: return " [DEBUG] ";
        case Level::LVL_INFO:  return " [INFO]  ";
        case Level::LVL_WARN:  return " [WARN]  ";
        case Level::LVL_ERROR: return " [ERROR] ";
        default: return " ";
    }
}

std::string upper(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(), ::toupper);
    return out;
}

} // namespace

void Logger::init(Level threshold) {
    threshold_ = threshold;
}

void Logger::set_level(Level level) {
    threshold_ = level;
}

Level Logger::level() {
    return threshold_;
}

bool Logger::set_file(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.close();
    }

    std::error_code ec;
    const auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
    }

    file_.open(path, std::ios::out | std::ios::app);
    return file_.is_open();
}

void Logger::close_file() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.close();
    }
}

void Logger::log(Level level, const char* file, int line, const std::string& message) {
    (void)file;
    (void)line;
    if (level < threshold_) {
        return;
    }

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm_buf;
    localtime_r(&time, &tm_buf);

    std::ostringstream line_out;
    line_out << "[" << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    line_out << "." << std::setfill('0') << std::setw(3) << ms.count() << "]";
    line_out << level_tag(level) << message << "\n";

    std::lock_guard<std::mutex> lock(mutex_);
    std::cerr << line_out.str();
    if (file_.is_open()) {
        file_ << line_out.str();
    }

    // Flush on error so crash diagnostics are not lost
    if (level >= Level::LVL_ERROR) {
        std::cerr << std::flush;
        if (file_.is_open()) {
            file_.flush();
        }
    }
}

Level string_to_level(const std::string& level_str) {
    std::string s = upper(level_str);

    if (s == "DEBUG") return Level::LVL_DEBUG;
    if (s == "INFO") return Level::LVL_INFO;
    if (s == "WARN") return Level::LVL_WARN;
    if (s == "ERROR") return Level::LVL_ERROR;

    return Level::LVL_INFO; // Default
}

bool is_valid_level(const std::string& level_str) {
    std::string s = upper(level_str);
    return s == "DEBUG" || s == "INFO" || s == "WARN" || s == "ERROR";
}

} // namespace logging
} // namespace helm
