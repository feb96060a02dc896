// common/utils/logger.cpp
#include "common/utils/logger.h"
#include <atomic>
#include <iostream>
#include <mutex>
#include <stdexcept>

namespace canvasflow {

namespace {

std::atomic<LogLevel> g_level{LogLevel::INFO};
std::mutex g_write_mutex; // keeps lines from concurrent runs intact

const char* level_tag(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "[DEBUG]";
        case LogLevel::INFO: return "[INFO]";
        case LogLevel::WARN: return "[WARN]";
        case LogLevel::ERROR: return "[ERROR]";
        case LogLevel::OFF: return "";
    }
    return "";
}

} // namespace

LogLevel parse_log_level(std::string_view name) {
    if (name == "debug") return LogLevel::DEBUG;
    if (name == "info") return LogLevel::INFO;
    if (name == "warn" || name == "warning") return LogLevel::WARN;
    if (name == "error") return LogLevel::ERROR;
    if (name == "off") return LogLevel::OFF;
    throw std::runtime_error("Unknown log level '" + std::string(name) + "'");
}

void Logger::set_level(LogLevel level) {
    g_level.store(level);
}

LogLevel Logger::level() {
    return g_level.load();
}

bool Logger::enabled(LogLevel level) {
    return level != LogLevel::OFF && level >= g_level.load();
}

void Logger::write(LogLevel level, std::string_view component, const std::string& message) {
    if (!enabled(level)) return;
    std::lock_guard<std::mutex> lock(g_write_mutex);
    std::cerr << level_tag(level) << " [" << component << "] " << message << std::endl;
}

} // namespace canvasflow
