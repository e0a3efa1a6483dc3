#ifndef LOGGER_H
#define LOGGER_H

#include <string>
#include <functional>

// Log level enumeration for conditional logging
enum class LogLevel {
    DEBUG = 0,     // Every message (most verbose)
    INFO = 1,      // Important events
    WARNING = 2,   // Problems only
    ERROR = 3,     // Errors only
    NONE = 4,      // Disable all logging
};

// Tag prefixed to every line (the local node id in practice)
void setSessionId(const std::string& session_id);
void nativeLog(const std::string& message);

// Redirect log lines to a callback instead of stderr (desktop CLI, tests).
// Passing nullptr restores stderr output. The callback runs under the logger
// lock and must not log itself.
void setLogCallback(std::function<void(const std::string&)> callback);

// Default: INFO (skips debug messages)
void set_log_level(LogLevel level);
LogLevel get_log_level();

// Parses debug|info|warn|warning|error|none (case-insensitive).
// Unknown values map to INFO.
LogLevel log_level_from_string(const std::string& value);
const char* log_level_to_string(LogLevel level);

// Async logging: lines go to a queue drained by a background thread
void enable_async_logging();
void disable_async_logging();
bool is_async_logging_enabled();

#define LOG_DEBUG(msg) if (get_log_level() <= LogLevel::DEBUG) nativeLog(std::string("DEBUG: ") + (msg))
#define LOG_INFO(msg)  if (get_log_level() <= LogLevel::INFO) nativeLog(std::string("INFO: ") + (msg))
#define LOG_WARN(msg)  if (get_log_level() <= LogLevel::WARNING) nativeLog(std::string("WARN: ") + (msg))
#define LOG_ERROR(msg) if (get_log_level() <= LogLevel::ERROR) nativeLog(std::string("ERROR: ") + (msg))

#endif // LOGGER_H
