#include "lifecycle_coordinator.h"
#include "session_manager_p.h"

namespace detail {
    namespace {
        const char* const RESTART_TIMER_KEY = "services";
    }

    LifecycleCoordinator::LifecycleCoordinator(SessionManager::Impl* sm) : m_sm(sm) {}

    void LifecycleCoordinator::handle(const AppLifecycleEvent& event) {
        switch (event.transition) {
            case AppTransition::ENTERED_BACKGROUND:
                enterBackground();
                break;
            case AppTransition::ENTERED_FOREGROUND:
                enterForeground();
                break;
        }
    }

    void LifecycleCoordinator::enterBackground() {
        if (m_sm->m_in_background) {
            LOG_DEBUG("SM: already in background");
            return;
        }
        m_sm->m_in_background = true;

        // A restart that never ran leaves the resume flags from the previous background in place
        const bool restart_pending = m_sm->m_timers.cancel(TimerKind::RESTART, RESTART_TIMER_KEY);
        const size_t cancelled = (restart_pending ? 1 : 0) + m_sm->m_timers.cancelKind(TimerKind::BACKUP_INVITE);

        if (!restart_pending) {
            m_sm->m_resume_browsing = m_sm->m_browsing;
            m_sm->m_resume_advertising = m_sm->m_advertising;
        }
        m_sm->stopBrowsingService();
        m_sm->stopAdvertisingService();

        m_sm->m_journal.info("Entered background, discovery paused" +
                             (cancelled > 0 ? " (" + std::to_string(cancelled) + " timer(s) cancelled)" : std::string()));

        if (m_sm->m_disconnect_in_background) {
            m_sm->disconnectSessionInternal("background");
        }
    }

    void LifecycleCoordinator::enterForeground() {
        if (!m_sm->m_in_background) {
            LOG_DEBUG("SM: foreground notification while already in foreground");
            return;
        }
        m_sm->m_in_background = false;

        const auto delay = m_sm->m_settings.restart_debounce;
        m_sm->m_journal.info("Entered foreground, restarting services in " + std::to_string(delay.count()) + "ms");
        m_sm->armTimer(TimerKind::RESTART, RESTART_TIMER_KEY, delay, [this]() { restartServices(); });
    }

    void LifecycleCoordinator::restartServices() {
        if (m_sm->m_in_background) {
            LOG_DEBUG("SM: restart skipped, back in background");
            return;
        }

        const bool browse = m_sm->m_resume_browsing;
        const bool advertise = m_sm->m_resume_advertising;
        m_sm->m_resume_browsing = false;
        m_sm->m_resume_advertising = false;

        m_sm->recreateServices(browse, advertise);
        m_sm->m_journal.info(std::string("Services recreated (browsing ") + (browse ? "on" : "off") +
                             ", advertising " + (advertise ? "on" : "off") + ")");
    }
}
