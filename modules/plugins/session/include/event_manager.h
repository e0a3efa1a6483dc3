#ifndef EVENT_MANAGER_H
#define EVENT_MANAGER_H

#include "unified_event_loop.h"
#include <memory>
#include <mutex>
#include <thread>
#include <atomic>

/**
 * @brief EventManager - runs the UnifiedEventLoop on a dedicated thread.
 *
 * The loop itself is single-threaded; running it in its own thread makes
 * start() non-blocking for callers. Start and stop are serialized and may be
 * repeated.
 */
class EventManager {
public:
    EventManager();
    ~EventManager();

    void startEventProcessing();
    // Stops the loop and joins its thread. Must not be called from the loop thread.
    void stopEventProcessing();
    bool isRunning() const { return m_running.load(std::memory_order_acquire); }

    UnifiedEventLoop& getUnifiedEventLoop() { return *m_unified_loop; }

private:
    std::unique_ptr<UnifiedEventLoop> m_unified_loop;
    std::thread m_loop_thread;

    // Serializes start/stop to avoid races and double-start std::terminate.
    std::mutex m_lifecycleMutex;
    std::atomic<bool> m_running{false};
};

#endif // EVENT_MANAGER_H
