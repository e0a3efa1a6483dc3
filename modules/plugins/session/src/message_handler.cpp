#include "message_handler.h"
#include "session_manager_p.h"

#include <cstring>

namespace detail {
    MessageHandler::MessageHandler(SessionManager::Impl* sm) : m_sm(sm) {}

    const Bytes& MessageHandler::ackMarker() {
        static const Bytes marker(ACK_MARKER, ACK_MARKER + std::strlen(ACK_MARKER));
        return marker;
    }

    bool MessageHandler::isAck(const Bytes& data) {
        return data == ackMarker();
    }

    void MessageHandler::handleDataReceived(const DataReceivedEvent& event) {
        if (isAck(event.data)) {
            m_sm->m_journal.info("ACK received from " + event.peer.label());
            return;
        }

        m_sm->m_journal.info("Received " + std::to_string(event.data.size()) + " byte(s) from " + event.peer.label());

        std::string error;
        if (!m_sm->m_session->send(ackMarker(), {event.peer}, &error)) {
            m_sm->m_journal.error("Failed to send ACK to " + event.peer.label() + ": " +
                                  (error.empty() ? "unknown error" : error));
            return;
        }
        m_sm->m_journal.debug("ACK sent to " + event.peer.label());
    }

    void MessageHandler::handleSend(const Bytes& data) {
        const std::vector<PeerId> targets = m_sm->m_registry.selectedPeers();
        if (targets.empty()) {
            m_sm->m_journal.warn("No peers selected, nothing sent");
            return;
        }

        std::string error;
        if (!m_sm->m_session->send(data, targets, &error)) {
            m_sm->m_journal.error("Send failed: " + (error.empty() ? std::string("unknown error") : error));
            return;
        }
        m_sm->m_journal.info("Sent " + std::to_string(data.size()) + " byte(s) to " +
                             std::to_string(targets.size()) + " peer(s)");
    }
}
