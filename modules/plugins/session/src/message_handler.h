#pragma once

#include "session_events.h"
#include "session_manager.h"

namespace detail {
    // Outbound sends to selected peers and the one-hop acknowledgment
    class MessageHandler {
    public:
        explicit MessageHandler(SessionManager::Impl* sm);
        void handleDataReceived(const DataReceivedEvent& event);
        void handleSend(const Bytes& data);

        static const Bytes& ackMarker();
        static bool isAck(const Bytes& data);
    private:
        SessionManager::Impl* m_sm;
    };
}
