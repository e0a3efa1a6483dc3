#include "log_journal.h"
#include <algorithm>
#include <ctime>
#include <iomanip>
#include <sstream>

std::string format_log_entry(const LogEntry& entry) {
    const std::time_t t = std::chrono::system_clock::to_time_t(entry.timestamp);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        entry.timestamp.time_since_epoch()) % 1000;
    std::tm tm{};
    localtime_r(&t, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%H:%M:%S") << "." << std::setfill('0') << std::setw(3) << ms.count()
        << " " << log_level_to_string(entry.level) << "  " << entry.message;
    return oss.str();
}

LogJournal::LogJournal(std::string tag, size_t max_entries)
    : m_tag(std::move(tag)), m_max_entries(std::max<size_t>(1, max_entries)) {}

void LogJournal::add(LogLevel level, const std::string& message) {
    switch (level) {
        case LogLevel::DEBUG: LOG_DEBUG(m_tag + ": " + message); break;
        case LogLevel::INFO: LOG_INFO(m_tag + ": " + message); break;
        case LogLevel::WARNING: LOG_WARN(m_tag + ": " + message); break;
        case LogLevel::ERROR: LOG_ERROR(m_tag + ": " + message); break;
        case LogLevel::NONE: break;
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        LogEntry entry;
        entry.message = message;
        entry.timestamp = std::chrono::system_clock::now();
        entry.id = m_next_id++;
        entry.level = level;
        m_entries.push_back(std::move(entry));
        while (m_entries.size() > m_max_entries) {
            m_entries.pop_front();
        }
    }
    notify();
}

std::vector<LogEntry> LogJournal::entries() const {
    std::vector<LogEntry> out;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        out.assign(m_entries.begin(), m_entries.end());
    }
    std::sort(out.begin(), out.end(), [](const LogEntry& a, const LogEntry& b) {
        if (a.timestamp != b.timestamp) return a.timestamp > b.timestamp;
        return a.id > b.id;
    });
    return out;
}

size_t LogJournal::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.size();
}

void LogJournal::clear() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_entries.clear();
    }
    notify();
}

void LogJournal::setObserver(Observer observer) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_observer = std::move(observer);
}

void LogJournal::notify() {
    Observer observer;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        observer = m_observer;
    }
    if (observer) observer();
}
