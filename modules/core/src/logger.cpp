#include "logger.h"
#include <mutex>
#include <string>
#include <iostream>
#include <queue>
#include <thread>
#include <memory>
#include <condition_variable>
#include <atomic>
#include <algorithm>
#include <cctype>

/**
 * @brief Tag prefixed to every log line.
 */
static std::string g_sessionId = "NO_SESSION";

/**
 * @brief Mutex for protecting the logger state.
 */
static std::mutex g_logMutex;

/**
 * @brief Global log level (for conditional logging)
 * Default: INFO (skips DEBUG messages)
 */
static std::atomic<LogLevel> g_log_level(LogLevel::INFO);

/**
 * @brief Optional sink replacing stderr output.
 */
static std::function<void(const std::string&)> g_log_callback;

/**
 * @brief Global async logging state
 */
static std::atomic<bool> g_async_logging_enabled(false);
static std::queue<std::string> g_log_queue;
static std::mutex g_log_queue_mutex;
static std::condition_variable g_log_queue_cv;
static std::atomic<bool> g_log_thread_running(false);
static std::unique_ptr<std::thread> g_log_thread;

/**
 * @brief Writes one formatted line to the active sink. Caller holds g_logMutex.
 */
static void emit_locked(const std::string& line) {
    if (g_log_callback) {
        g_log_callback(line);
    } else {
        std::cerr << line << std::endl;
    }
}

void setSessionId(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_sessionId = session_id;
}

void setLogCallback(std::function<void(const std::string&)> callback) {
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_log_callback = std::move(callback);
}

void set_log_level(LogLevel level) {
    g_log_level.store(level);
}

LogLevel get_log_level() {
    return g_log_level.load();
}

LogLevel log_level_from_string(const std::string& value) {
    std::string v = value;
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "debug") return LogLevel::DEBUG;
    if (v == "info") return LogLevel::INFO;
    if (v == "warn" || v == "warning") return LogLevel::WARNING;
    if (v == "error") return LogLevel::ERROR;
    if (v == "none" || v == "off") return LogLevel::NONE;
    return LogLevel::INFO;
}

const char* log_level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "debug";
        case LogLevel::INFO: return "info";
        case LogLevel::WARNING: return "warning";
        case LogLevel::ERROR: return "error";
        case LogLevel::NONE: return "none";
    }
    return "info";
}

/**
 * @brief Background thread worker for async logging
 */
static void async_log_worker() {
    for (;;) {
        std::unique_lock<std::mutex> lock(g_log_queue_mutex);
        g_log_queue_cv.wait(lock, [] { return !g_log_queue.empty() || !g_log_thread_running; });

        if (g_log_queue.empty()) {
            if (!g_log_thread_running) break;
            continue;
        }

        auto msg = std::move(g_log_queue.front());
        g_log_queue.pop();
        lock.unlock();

        // Emit without holding the queue lock so producers never wait on I/O
        std::lock_guard<std::mutex> out_lock(g_logMutex);
        emit_locked(msg);
    }
}

void enable_async_logging() {
    std::lock_guard<std::mutex> lock(g_logMutex);
    if (g_async_logging_enabled) return;

    g_log_thread_running = true;
    g_log_thread = std::make_unique<std::thread>(async_log_worker);
    g_async_logging_enabled = true;
}

/**
 * @brief Disables async logging; queued lines are flushed before the worker exits.
 */
void disable_async_logging() {
    if (!g_async_logging_enabled.exchange(false)) return;

    {
        std::lock_guard<std::mutex> lock(g_log_queue_mutex);
        g_log_thread_running = false;
    }
    g_log_queue_cv.notify_all();

    if (g_log_thread && g_log_thread->joinable()) {
        g_log_thread->join();
    }
    g_log_thread.reset();
}

bool is_async_logging_enabled() {
    return g_async_logging_enabled.load();
}

void nativeLog(const std::string& message) {
    std::string log_message;
    {
        std::lock_guard<std::mutex> lock(g_logMutex);
        log_message = "[" + g_sessionId + "] " + message;
    }

    if (is_async_logging_enabled()) {
        {
            std::lock_guard<std::mutex> lock(g_log_queue_mutex);
            g_log_queue.push(std::move(log_message));
        }
        g_log_queue_cv.notify_one();
    } else {
        std::lock_guard<std::mutex> lock(g_logMutex);
        emit_locked(log_message);
    }
}
