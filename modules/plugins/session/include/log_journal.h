#ifndef LOG_JOURNAL_H
#define LOG_JOURNAL_H

#include "logger.h"
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

struct LogEntry {
    std::string message;
    std::chrono::system_clock::time_point timestamp;
    uint64_t id = 0;
    LogLevel level = LogLevel::INFO;
};

std::string format_log_entry(const LogEntry& entry);

/**
 * @brief Bounded, thread-safe log stream shown to the UI.
 *
 * Every entry is also forwarded to the native logger at its level, prefixed
 * with the journal tag. Oldest entries are dropped once max_entries is reached.
 */
class LogJournal {
public:
    using Observer = std::function<void()>;

    explicit LogJournal(std::string tag, size_t max_entries);

    void add(LogLevel level, const std::string& message);
    void debug(const std::string& message) { add(LogLevel::DEBUG, message); }
    void info(const std::string& message) { add(LogLevel::INFO, message); }
    void warn(const std::string& message) { add(LogLevel::WARNING, message); }
    void error(const std::string& message) { add(LogLevel::ERROR, message); }

    // Newest first by timestamp, ties broken by id
    std::vector<LogEntry> entries() const;
    size_t size() const;
    void clear();

    // Called after every add/clear, outside the journal lock
    void setObserver(Observer observer);

private:
    void notify();

    std::string m_tag;
    size_t m_max_entries;

    mutable std::mutex m_mutex;
    std::deque<LogEntry> m_entries;
    uint64_t m_next_id{1};
    Observer m_observer;
};

#endif // LOG_JOURNAL_H
