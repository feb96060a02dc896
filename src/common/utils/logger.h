#ifndef CANVASFLOW_COMMON_UTILS_LOGGER_H
#define CANVASFLOW_COMMON_UTILS_LOGGER_H

#include <cstdint>
#include <sstream>
#include <string>
#include <string_view>

namespace canvasflow {

enum class LogLevel : uint8_t {
    DEBUG,
    INFO,
    WARN,
    ERROR,
    OFF
};

// Throws std::runtime_error on an unknown level name
LogLevel parse_log_level(std::string_view name);

// Process-wide, levelled, tagged lines on std::cerr:
//   [INFO] [ExecutionSession] exec_1700000000000_1: block A01 completed
class Logger {
public:
    static void set_level(LogLevel level);
    static LogLevel level();
    static bool enabled(LogLevel level);

    static void write(LogLevel level, std::string_view component, const std::string& message);

    static void debug(std::string_view component, const std::string& message) { write(LogLevel::DEBUG, component, message); }
    static void info(std::string_view component, const std::string& message) { write(LogLevel::INFO, component, message); }
    static void warn(std::string_view component, const std::string& message) { write(LogLevel::WARN, component, message); }
    static void error(std::string_view component, const std::string& message) { write(LogLevel::ERROR, component, message); }
};

// Builds a message only when the level is enabled
template <typename... Args>
void log_fmt(LogLevel level, std::string_view component, Args&&... args) {
    if (!Logger::enabled(level)) return;
    std::ostringstream oss;
    (oss << ... << std::forward<Args>(args));
    Logger::write(level, component, oss.str());
}

} // namespace canvasflow

#endif // CANVASFLOW_COMMON_UTILS_LOGGER_H
