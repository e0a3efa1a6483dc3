#pragma once

#include "session_events.h"
#include "session_manager.h"

namespace detail {
    // Discovery funnel consumer: visibility, first sighting and the tie-break invite
    class DiscoveryHandler {
    public:
        explicit DiscoveryHandler(SessionManager::Impl* sm);
        void handle(const DiscoveryEvent& event);
    private:
        void handlePeerFound(const PeerFoundEvent& event);
        void handlePeerLost(const PeerLostEvent& event);
        void handleBrowsingFailed(const BrowsingFailedEvent& event);
        bool isStale(uint64_t generation) const;

        SessionManager::Impl* m_sm;
    };
}
