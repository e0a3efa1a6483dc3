#pragma once

#include "session_events.h"
#include "session_manager.h"

namespace detail {
    class AdvertisingHandler {
    public:
        explicit AdvertisingHandler(SessionManager::Impl* sm);
        void handle(const AdvertisingEvent& event);
    private:
        void handleInvitation(const InvitationReceivedEvent& event);
        void handleAdvertisingFailed(const AdvertisingFailedEvent& event);

        SessionManager::Impl* m_sm;
    };
}
