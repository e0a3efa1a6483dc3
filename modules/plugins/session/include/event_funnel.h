#ifndef EVENT_FUNNEL_H
#define EVENT_FUNNEL_H

#include "unified_event_loop.h"
#include "logger.h"
#include <deque>
#include <functional>
#include <mutex>
#include <string>

/**
 * @brief EventFunnel - ordered multi-producer queue for one event category.
 *
 * Producers on any thread call push(), which never blocks on the consumer and
 * never applies backpressure. The funnel registers itself as an event source
 * of the given loop, so its handler only ever runs on the loop thread, in
 * arrival order. Several funnels sharing one loop never run concurrently.
 *
 * Funnels start closed. A closed funnel discards buffered events and rejects
 * new ones until it is opened again. The owning loop must not be running when the funnel is destroyed.
 */
template <typename Event>
class EventFunnel {
public:
    using Handler = std::function<void(const Event&)>;

    EventFunnel(std::string name, UnifiedEventLoop& loop, Handler handler)
        : m_name(std::move(name)), m_loop(loop), m_handler(std::move(handler)) {
        m_source_id = m_loop.addEventSource([this]() { return drain(); });
    }

    ~EventFunnel() {
        close();
        m_loop.removeEventSource(m_source_id);
    }

    EventFunnel(const EventFunnel&) = delete;
    EventFunnel& operator=(const EventFunnel&) = delete;

    // Returns false if the funnel is closed and the event was dropped.
    bool push(Event event) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_closed) {
                return false;
            }
            m_queue.push_back(std::move(event));
        }
        m_loop.wakeup();
        return true;
    }

    // Loop thread only.
    size_t drain() {
        std::deque<Event> batch;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_closed || m_queue.empty()) {
                return 0;
            }
            std::swap(batch, m_queue);
        }

        size_t handled = 0;
        for (const auto& event : batch) {
            if (isClosed()) {
                LOG_DEBUG("Funnel " + m_name + ": closed mid-batch, discarding " +
                          std::to_string(batch.size() - handled) + " event(s)");
                break;
            }
            m_handler(event);
            ++handled;
        }
        return handled;
    }

    void close() {
        size_t discarded = 0;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_closed = true;
            discarded = m_queue.size();
            m_queue.clear();
        }
        if (discarded > 0) {
            LOG_DEBUG("Funnel " + m_name + ": discarded " + std::to_string(discarded) + " buffered event(s)");
        }
    }

    void open() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_closed = false;
    }

    bool isClosed() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_closed;
    }

    size_t pending() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_queue.size();
    }

    const std::string& name() const { return m_name; }

private:
    std::string m_name;
    UnifiedEventLoop& m_loop;
    Handler m_handler;
    int m_source_id{0};

    mutable std::mutex m_mutex;
    std::deque<Event> m_queue;
    bool m_closed{true};
};

#endif // EVENT_FUNNEL_H
