#ifndef TIMER_TABLE_H
#define TIMER_TABLE_H

#include "unified_event_loop.h"
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <utility>

enum class TimerKind {
    BACKUP_INVITE,   // keyed by peer id
    RESTART          // lifecycle restart debounce
};

const char* timer_kind_to_string(TimerKind kind);

/**
 * @brief At most one live timer per (kind, key), scheduled on the loop.
 *
 * Every arm() hands out a fresh generation. The fire path checks that the
 * generation is still current before running the callback, so a timer that
 * was superseded or cancelled after the loop picked it up never runs.
 *
 * Loop thread only (or with the loop stopped).
 */
class TimerTable {
public:
    using Callback = std::function<void()>;

    explicit TimerTable(UnifiedEventLoop& loop);

    // Replaces any live timer of the same kind and key
    void arm(TimerKind kind, const std::string& key, std::chrono::milliseconds delay, Callback callback);
    bool cancel(TimerKind kind, const std::string& key);
    size_t cancelKind(TimerKind kind);
    void cancelAll();

    bool isArmed(TimerKind kind, const std::string& key) const;
    size_t armedCount(TimerKind kind) const;

private:
    using Key = std::pair<TimerKind, std::string>;

    static std::string taskId(TimerKind kind, const std::string& key);
    void fire(TimerKind kind, const std::string& key, uint64_t generation, const Callback& callback);

    UnifiedEventLoop& m_loop;
    std::map<Key, uint64_t> m_armed;
    uint64_t m_next_generation{1};
};

#endif // TIMER_TABLE_H
