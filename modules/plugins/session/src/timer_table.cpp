#include "timer_table.h"
#include "logger.h"

const char* timer_kind_to_string(TimerKind kind) {
    switch (kind) {
        case TimerKind::BACKUP_INVITE: return "backup-invite";
        case TimerKind::RESTART: return "restart";
    }
    return "timer";
}

TimerTable::TimerTable(UnifiedEventLoop& loop) : m_loop(loop) {}

std::string TimerTable::taskId(TimerKind kind, const std::string& key) {
    return std::string(timer_kind_to_string(kind)) + ":" + key;
}

void TimerTable::arm(TimerKind kind, const std::string& key, std::chrono::milliseconds delay, Callback callback) {
    const uint64_t generation = m_next_generation++;
    const bool replaced = m_armed.count({kind, key}) > 0;
    m_armed[{kind, key}] = generation;

    m_loop.addScheduledTask(
        taskId(kind, key),
        [this, kind, key, generation, cb = std::move(callback)]() { fire(kind, key, generation, cb); },
        std::chrono::steady_clock::now() + delay);

    LOG_DEBUG(std::string("Timers: armed ") + taskId(kind, key) + " in " +
              std::to_string(delay.count()) + "ms" + (replaced ? " (replaced previous)" : ""));
}

void TimerTable::fire(TimerKind kind, const std::string& key, uint64_t generation, const Callback& callback) {
    auto it = m_armed.find({kind, key});
    if (it == m_armed.end() || it->second != generation) {
        LOG_DEBUG("Timers: superseded " + taskId(kind, key) + " ignored");
        return;
    }
    m_armed.erase(it);
    callback();
}

bool TimerTable::cancel(TimerKind kind, const std::string& key) {
    auto it = m_armed.find({kind, key});
    if (it == m_armed.end()) {
        return false;
    }
    m_armed.erase(it);
    m_loop.removeScheduledTask(taskId(kind, key));
    LOG_DEBUG("Timers: cancelled " + taskId(kind, key));
    return true;
}

size_t TimerTable::cancelKind(TimerKind kind) {
    size_t cancelled = 0;
    for (auto it = m_armed.begin(); it != m_armed.end();) {
        if (it->first.first == kind) {
            m_loop.removeScheduledTask(taskId(kind, it->first.second));
            it = m_armed.erase(it);
            ++cancelled;
        } else {
            ++it;
        }
    }
    return cancelled;
}

void TimerTable::cancelAll() {
    for (const auto& entry : m_armed) {
        m_loop.removeScheduledTask(taskId(entry.first.first, entry.first.second));
    }
    m_armed.clear();
}

bool TimerTable::isArmed(TimerKind kind, const std::string& key) const {
    return m_armed.count({kind, key}) > 0;
}

size_t TimerTable::armedCount(TimerKind kind) const {
    size_t n = 0;
    for (const auto& entry : m_armed) {
        if (entry.first.first == kind) ++n;
    }
    return n;
}
