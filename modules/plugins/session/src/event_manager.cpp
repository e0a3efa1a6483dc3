#include "event_manager.h"
#include "logger.h"

EventManager::EventManager() : m_unified_loop(std::make_unique<UnifiedEventLoop>()) {}

EventManager::~EventManager() {
    stopEventProcessing();
}

void EventManager::startEventProcessing() {
    std::lock_guard<std::mutex> lifecycle_lock(m_lifecycleMutex);

    if (m_running.load(std::memory_order_acquire)) {
        LOG_WARN("EM: startEventProcessing called while already running - ignoring");
        return;
    }

    // A thread left over from a previous run has already been asked to stop
    if (m_loop_thread.joinable()) {
        m_unified_loop->stop();
        m_loop_thread.join();
    }

    m_unified_loop->clearStopRequest();
    m_running = true;

    m_loop_thread = std::thread([this]() {
        LOG_DEBUG("EM: UnifiedEventLoop thread started");
        m_unified_loop->start();
        LOG_DEBUG("EM: UnifiedEventLoop thread finished");
    });
}

void EventManager::stopEventProcessing() {
    std::lock_guard<std::mutex> lifecycle_lock(m_lifecycleMutex);

    if (!m_running.load(std::memory_order_acquire) && !m_loop_thread.joinable()) {
        return;
    }

    if (m_unified_loop->isLoopThread()) {
        LOG_ERROR("EM: stopEventProcessing called from the loop thread - refusing to self-join");
        m_unified_loop->stop();
        return;
    }

    m_unified_loop->stop();
    if (m_loop_thread.joinable()) {
        m_loop_thread.join();
    }
    m_running = false;
    LOG_DEBUG("EM: Event processing stopped");
}
