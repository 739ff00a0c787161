// src/common/logger.cpp
#include "common/logger.h"
#include <iostream>
#include <iomanip>
#include <ctime>
#include <chrono>
#include <sstream>

namespace aep {

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::Logger()
    : console_output_enabled_(true)
    , level_(LogLevel::INFO) {
}

Logger::~Logger() {
    if (log_file_.is_open()) {
        log_file_.close();
    }
}

bool Logger::setLogFile(const std::string& filename) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (log_file_.is_open()) {
        log_file_.close();
    }
    log_file_.clear();
    log_file_.open(filename, std::ios::out | std::ios::app);
    if (!log_file_) {
        std::cerr << "Failed to open log file: " << filename << std::endl;
        return false;
    }
    return true;
}

void Logger::closeLogFile() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (log_file_.is_open()) {
        log_file_.close();
    }
}

void Logger::enableConsoleOutput(bool enable) {
    std::lock_guard<std::mutex> lock(mutex_);
    console_output_enabled_ = enable;
}

void Logger::setLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

LogLevel Logger::getLevel() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

void Logger::log(const std::string& message) {
    log(LogLevel::INFO, message);
}

void Logger::log(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level < level_) {
        return;
    }
    write(level, message);
}

std::string Logger::getLevelString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:   return "DEBUG";
        case LogLevel::INFO:    return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR:   return "ERROR";
        default:                return "UNKNOWN";
    }
}

void Logger::write(LogLevel level, const std::string& message) {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);

    std::tm tm_now;
#if defined(_WIN32) || defined(_WIN64)
    localtime_s(&tm_now, &time_t_now);
#else
    localtime_r(&time_t_now, &tm_now);
#endif
    std::ostringstream line;
    line << "[" << std::put_time(&tm_now, "%Y-%m-%d %H:%M:%S") << "] "
         << "[" << getLevelString(level) << "] " << message;

    if (console_output_enabled_) {
        if (level >= LogLevel::WARNING) {
            std::cerr << line.str() << std::endl;
        } else {
            std::cout << line.str() << std::endl;
        }
    }

    if (log_file_.is_open()) {
        log_file_ << line.str() << std::endl;
    }
}

} // namespace aep
