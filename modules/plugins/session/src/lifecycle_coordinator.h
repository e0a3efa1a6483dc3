#pragma once

#include "session_events.h"
#include "session_manager.h"

namespace detail {
    class LifecycleCoordinator {
    public:
        explicit LifecycleCoordinator(SessionManager::Impl* sm);
        void handle(const AppLifecycleEvent& event);
    private:
        void enterBackground();
        void enterForeground();
        void restartServices();

        SessionManager::Impl* m_sm;
    };
}
