#include "advertising_handler.h"
#include "session_manager_p.h"

#include <type_traits>

namespace detail {
    AdvertisingHandler::AdvertisingHandler(SessionManager::Impl* sm) : m_sm(sm) {}

    void AdvertisingHandler::handle(const AdvertisingEvent& event) {
        std::visit([this](auto&& e) {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, InvitationReceivedEvent>) handleInvitation(e);
            else if constexpr (std::is_same_v<T, AdvertisingFailedEvent>) handleAdvertisingFailed(e);
        }, event);
    }

    void AdvertisingHandler::handleInvitation(const InvitationReceivedEvent& event) {
        if (!event.handler) {
            m_sm->m_journal.warn("Invitation from " + event.peer.label() + " has no reply handler");
            return;
        }

        m_sm->m_registry.recordFirstSeen(event.peer.id, std::chrono::system_clock::now());

        // No access control: the state machine accepts every invitation
        PeerContext& ctx = m_sm->context(event.peer);
        FSMResult result = m_sm->m_fsm.handle_event(ctx, PeerEvent::INVITATION_RECEIVED);

        if (result.has(PeerAction::CANCEL_BACKUP_INVITE) &&
            m_sm->m_timers.cancel(TimerKind::BACKUP_INVITE, ctx.peer.id)) {
            m_sm->m_journal.info("Backup invite for " + ctx.peer.label() + " superseded by incoming invitation");
        }

        if (!result.has(PeerAction::ACCEPT_INVITATION)) {
            m_sm->m_journal.warn("Declining invitation from " + ctx.peer.label());
            event.handler(false, nullptr);
            m_sm->pruneContext(event.peer.id);
            return;
        }

        m_sm->m_journal.info("Accepting invitation from " + ctx.peer.label());
        event.handler(true, m_sm->m_session.get());

        // Session state arrives separately and recreates the context if needed
        m_sm->pruneContext(event.peer.id);
    }

    void AdvertisingHandler::handleAdvertisingFailed(const AdvertisingFailedEvent& event) {
        if (event.generation != m_sm->m_advertiser_generation || !m_sm->m_advertising) {
            LOG_DEBUG("SM: advertising failure from a retired advertiser ignored: " + event.error);
            return;
        }
        m_sm->m_advertising = false;
        m_sm->m_journal.error("Advertising failed to start: " + event.error);
    }
}
