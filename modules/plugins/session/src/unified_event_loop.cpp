#include "unified_event_loop.h"
#include "constants.h"
#include "logger.h"
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <errno.h>
#include <cstring>
#include <algorithm>
#include <stdexcept>

UnifiedEventLoop::UnifiedEventLoop() {
    if (pipe(m_wakeup_pipe) < 0) {
        throw std::runtime_error(std::string("UnifiedEventLoop: pipe() failed: ") + std::strerror(errno));
    }

    fcntl(m_wakeup_pipe[0], F_SETFL, O_NONBLOCK);
    fcntl(m_wakeup_pipe[1], F_SETFL, O_NONBLOCK);

    LOG_DEBUG("UnifiedEventLoop: Initialized");
}

UnifiedEventLoop::~UnifiedEventLoop() {
    stop();

    if (m_wakeup_pipe[0] >= 0) close(m_wakeup_pipe[0]);
    if (m_wakeup_pipe[1] >= 0) close(m_wakeup_pipe[1]);
}

void UnifiedEventLoop::start() {
    if (m_running.exchange(true, std::memory_order_acq_rel)) {
        LOG_WARN("UnifiedEventLoop: Already running");
        return;
    }

    m_loop_thread_id.store(std::this_thread::get_id());
    runLoop();
    m_loop_thread_id.store(std::thread::id());
    m_running.store(false, std::memory_order_release);
}

void UnifiedEventLoop::stop() {
    m_stopping.store(true, std::memory_order_release);
    wakeup();
}

void UnifiedEventLoop::clearStopRequest() {
    m_stopping.store(false, std::memory_order_release);
}

bool UnifiedEventLoop::isLoopThread() const {
    return m_loop_thread_id.load() == std::this_thread::get_id();
}

int UnifiedEventLoop::addEventSource(EventSource source) {
    std::lock_guard<std::mutex> lock(m_sources_mutex);
    const int id = m_next_source_id++;
    m_sources.push_back({id, std::move(source)});
    return id;
}

void UnifiedEventLoop::removeEventSource(int source_id) {
    std::lock_guard<std::mutex> lock(m_sources_mutex);
    m_sources.erase(
        std::remove_if(m_sources.begin(), m_sources.end(),
                       [source_id](const SourceEntry& e) { return e.id == source_id; }),
        m_sources.end());
}

void UnifiedEventLoop::post(Task task) {
    {
        std::lock_guard<std::mutex> lock(m_posted_mutex);
        m_posted.push_back(std::move(task));
    }
    wakeup();
}

void UnifiedEventLoop::addScheduledTask(const std::string& id, Task task,
                                        std::chrono::steady_clock::time_point due_time) {
    {
        std::lock_guard<std::mutex> lock(m_scheduled_mutex);

        // Remove existing task with same ID
        m_scheduled.erase(
            std::remove_if(m_scheduled.begin(), m_scheduled.end(),
                           [&id](const ScheduledTask& t) { return t.id == id; }),
            m_scheduled.end());

        auto pos = std::upper_bound(m_scheduled.begin(), m_scheduled.end(), due_time,
                                    [](const std::chrono::steady_clock::time_point& due, const ScheduledTask& t) {
                                        return due < t.due_time;
                                    });
        m_scheduled.insert(pos, ScheduledTask{id, std::move(task), due_time});
    }

    LOG_DEBUG("UnifiedEventLoop: Scheduled task added, id=" + id);
    // Deadline may be earlier than the current poll timeout
    wakeup();
}

void UnifiedEventLoop::removeScheduledTask(const std::string& id) {
    std::lock_guard<std::mutex> lock(m_scheduled_mutex);
    m_scheduled.erase(
        std::remove_if(m_scheduled.begin(), m_scheduled.end(),
                       [&id](const ScheduledTask& t) { return t.id == id; }),
        m_scheduled.end());
}

bool UnifiedEventLoop::hasScheduledTask(const std::string& id) const {
    std::lock_guard<std::mutex> lock(m_scheduled_mutex);
    return std::any_of(m_scheduled.begin(), m_scheduled.end(),
                       [&id](const ScheduledTask& t) { return t.id == id; });
}

size_t UnifiedEventLoop::scheduledTaskCount() const {
    std::lock_guard<std::mutex> lock(m_scheduled_mutex);
    return m_scheduled.size();
}

void UnifiedEventLoop::clearScheduledTasks() {
    std::lock_guard<std::mutex> lock(m_scheduled_mutex);
    m_scheduled.clear();
}

void UnifiedEventLoop::wakeup() {
    char c = 1;
    ssize_t n = write(m_wakeup_pipe[1], &c, 1);
    (void)n; // EAGAIN means a wakeup is already pending
}

size_t UnifiedEventLoop::runPending() {
    size_t handled = processPostedTasks();
    handled += processEventSources();
    handled += processTimers();
    return handled;
}

void UnifiedEventLoop::drainWakeupPipe() {
    char buf[256];
    while (read(m_wakeup_pipe[0], buf, sizeof(buf)) > 0) {}
}

void UnifiedEventLoop::runLoop() {
    LOG_DEBUG("UnifiedEventLoop: Entering main loop");

    while (!m_stopping.load(std::memory_order_acquire)) {
        struct pollfd pfd{m_wakeup_pipe[0], POLLIN, 0};
        int nfds = poll(&pfd, 1, calculateNextTimeout());

        if (nfds < 0) {
            if (errno != EINTR) {
                LOG_ERROR(std::string("UnifiedEventLoop: poll error: ") + std::strerror(errno));
            }
            continue;
        }
        if (nfds > 0 && (pfd.revents & POLLIN)) {
            drainWakeupPipe();
        }
        if (m_stopping.load(std::memory_order_acquire)) {
            break;
        }

        runPending();
    }

    LOG_DEBUG("UnifiedEventLoop: Exited main loop");
}

size_t UnifiedEventLoop::processPostedTasks() {
    std::deque<Task> tasks;
    {
        std::lock_guard<std::mutex> lock(m_posted_mutex);
        std::swap(tasks, m_posted);
    }

    for (auto& task : tasks) {
        if (task) task();
    }
    return tasks.size();
}

size_t UnifiedEventLoop::processEventSources() {
    std::vector<SourceEntry> sources;
    {
        std::lock_guard<std::mutex> lock(m_sources_mutex);
        sources = m_sources;
    }

    size_t handled = 0;
    for (auto& entry : sources) {
        handled += entry.source();
    }
    return handled;
}

size_t UnifiedEventLoop::processTimers() {
    const auto now = std::chrono::steady_clock::now();

    // Extract due tasks first; running them may schedule or cancel others
    std::vector<ScheduledTask> due;
    {
        std::lock_guard<std::mutex> lock(m_scheduled_mutex);
        auto split = std::find_if(m_scheduled.begin(), m_scheduled.end(),
                                  [now](const ScheduledTask& t) { return t.due_time > now; });
        due.assign(std::make_move_iterator(m_scheduled.begin()), std::make_move_iterator(split));
        m_scheduled.erase(m_scheduled.begin(), split);
    }

    for (auto& t : due) {
        if (t.task) t.task();
    }
    return due.size();
}

int UnifiedEventLoop::calculateNextTimeout() const {
    int timeout = EVENT_LOOP_MAX_WAIT_MS;

    std::lock_guard<std::mutex> lock(m_scheduled_mutex);
    if (!m_scheduled.empty()) {
        auto ms_until = std::chrono::duration_cast<std::chrono::milliseconds>(
            m_scheduled.front().due_time - std::chrono::steady_clock::now()).count();
        if (ms_until <= 0) {
            timeout = 0;
        } else if (ms_until < timeout) {
            // Round up so the task is due when poll returns
            timeout = static_cast<int>(ms_until) + 1;
        }
    }
    return timeout;
}
