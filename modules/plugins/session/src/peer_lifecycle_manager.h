#pragma once

#include "session_events.h"
#include "session_manager.h"

struct PeerContext;

namespace detail {
    // Session state consumer: registry membership and the reconnection policy
    class PeerLifecycleManager {
    public:
        explicit PeerLifecycleManager(SessionManager::Impl* sm);
        void handleSessionState(const SessionStateEvent& event);
        void handleDisconnectPeer(const std::string& peer_id);
    private:
        void attemptReconnect(PeerContext& ctx);
        void armBackupInvite(const PeerId& peer, int attempt);
        void onBackupInviteFired(const PeerId& peer);

        SessionManager::Impl* m_sm;
    };
}
