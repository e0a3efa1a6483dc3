#ifndef UNIFIED_EVENT_LOOP_H
#define UNIFIED_EVENT_LOOP_H

#include <functional>
#include <vector>
#include <deque>
#include <mutex>
#include <atomic>
#include <chrono>
#include <string>
#include <thread>

/**
 * @brief UnifiedEventLoop - the single serialized executor of the session layer.
 *
 * All registry and timer state is mutated from inside this loop. Other threads
 * only enqueue work (event funnels, posted tasks) and wake the loop through a
 * self-pipe that poll() waits on together with the next timer deadline.
 *
 * Each pass:
 * - drains posted tasks
 * - drains every registered event source in registration order
 * - runs scheduled tasks whose due time has passed
 *
 * Scheduled tasks are keyed by id; adding a task with an existing id replaces it.
 */
class UnifiedEventLoop {
public:
    using Task = std::function<void()>;
    // Drains one source, returns the number of events handled
    using EventSource = std::function<size_t()>;

    UnifiedEventLoop();
    ~UnifiedEventLoop();

    UnifiedEventLoop(const UnifiedEventLoop&) = delete;
    UnifiedEventLoop& operator=(const UnifiedEventLoop&) = delete;

    // Runs the loop on the calling thread until stop() is requested.
    void start();
    // Requests the loop to exit; safe from any thread, also before start().
    void stop();
    // Clears a pending stop request so the loop can be started again.
    void clearStopRequest();
    bool isRunning() const { return m_running.load(std::memory_order_acquire); }
    bool isLoopThread() const;

    // Event sources (funnel drains). Must not be removed while the loop runs.
    int addEventSource(EventSource source);
    void removeEventSource(int source_id);

    // One-shot task executed on the next pass
    void post(Task task);

    // Timer management
    void addScheduledTask(const std::string& id, Task task,
                          std::chrono::steady_clock::time_point due_time);
    void removeScheduledTask(const std::string& id);
    bool hasScheduledTask(const std::string& id) const;
    size_t scheduledTaskCount() const;
    void clearScheduledTasks();

    // Runs one pass without waiting. Returns the amount of work done.
    // Used by the loop itself and by tests that drive the executor by hand.
    size_t runPending();

    // Wake up the event loop (e.g., when new events are pushed)
    void wakeup();

private:
    void runLoop();
    size_t processPostedTasks();
    size_t processEventSources();
    size_t processTimers();
    int calculateNextTimeout() const;
    void drainWakeupPipe();

    struct ScheduledTask {
        std::string id;
        Task task;
        std::chrono::steady_clock::time_point due_time;
    };

    struct SourceEntry {
        int id;
        EventSource source;
    };

    std::atomic<bool> m_running{false};
    std::atomic<bool> m_stopping{false};
    std::atomic<std::thread::id> m_loop_thread_id{};

    // Wake-up pipe for cross-thread signaling
    int m_wakeup_pipe[2]{-1, -1};

    std::deque<Task> m_posted;
    std::mutex m_posted_mutex;

    std::vector<SourceEntry> m_sources;
    std::mutex m_sources_mutex;
    int m_next_source_id{1};

    // Sorted by due time
    std::vector<ScheduledTask> m_scheduled;
    mutable std::mutex m_scheduled_mutex;
};

#endif // UNIFIED_EVENT_LOOP_H
