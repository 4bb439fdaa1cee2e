// =============================================================================
// log.cpp - Logger Implementation
// =============================================================================

#include "lever/log.hpp"

#include <atomic>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace lever {

namespace {

std::mutex log_mutex;
std::atomic<LogLevel> min_level{LogLevel::WARNING};
std::ostream* sink = nullptr;
std::ofstream log_file;

std::string now_to_string() {
    std::time_t t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm_buf{};
    localtime_r(&t, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm_buf);
    return std::string(buf);
}

} // namespace

void Logger::initialize(LogLevel level, std::ostream* stream) {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (log_file.is_open()) log_file.close();
    sink = stream;
    min_level.store(level);
}

void Logger::initialize_file(const std::string& path, LogLevel level) {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (log_file.is_open()) log_file.close();
    log_file.open(path, std::ios::out | std::ios::app);
    if (!log_file.is_open()) {
        throw std::runtime_error("Cannot open log file: " + path);
    }
    sink = &log_file;
    min_level.store(level);
}

void Logger::set_level(LogLevel level) {
    min_level.store(level);
}

LogLevel Logger::level() {
    return min_level.load();
}

bool Logger::enabled(LogLevel level) {
    return level != LogLevel::OFF && level >= min_level.load();
}

LogLevel Logger::parse_level(std::string_view name) {
    if (name == "debug") return LogLevel::DEBUG;
    if (name == "info") return LogLevel::INFO;
    if (name == "warning" || name == "warn") return LogLevel::WARNING;
    if (name == "error") return LogLevel::ERROR;
    if (name == "off") return LogLevel::OFF;
    throw std::invalid_argument("unknown log level: " + std::string(name));
}

const char* Logger::level_name(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::OFF: return "OFF";
    }
    return "UNK";
}

void Logger::log(LogLevel level, std::string_view message) {
    if (!enabled(level)) return;

    std::string line = fmt::format("{} [{}] ({}) {}\n", now_to_string(), level_name(level),
                                   std::hash<std::thread::id>{}(std::this_thread::get_id()) % 100000,
                                   message);

    std::lock_guard<std::mutex> lock(log_mutex);
    std::ostream& out = sink ? *sink : std::clog;
    out << line;
    out.flush();
}

} // namespace lever
