#include "discovery_handler.h"
#include "session_manager_p.h"

#include <type_traits>

namespace detail {
    DiscoveryHandler::DiscoveryHandler(SessionManager::Impl* sm) : m_sm(sm) {}

    void DiscoveryHandler::handle(const DiscoveryEvent& event) {
        std::visit([this](auto&& e) {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, PeerFoundEvent>) handlePeerFound(e);
            else if constexpr (std::is_same_v<T, PeerLostEvent>) handlePeerLost(e);
            else if constexpr (std::is_same_v<T, BrowsingFailedEvent>) handleBrowsingFailed(e);
        }, event);
    }

    bool DiscoveryHandler::isStale(uint64_t generation) const {
        return generation != m_sm->m_browser_generation || !m_sm->m_browsing;
    }

    void DiscoveryHandler::handlePeerFound(const PeerFoundEvent& event) {
        if (isStale(event.generation)) {
            LOG_DEBUG("SM: found " + event.peer.id + " from a retired browser, ignored");
            return;
        }
        if (event.peer == m_sm->m_identity.peer()) {
            LOG_DEBUG("SM: ignoring self-discovery");
            return;
        }

        m_sm->m_registry.recordFirstSeen(event.peer.id, std::chrono::system_clock::now());

        // Transports that only carry the id advertise the name in the discovery info
        PeerId peer = event.peer;
        if (peer.display_name.empty()) {
            auto name = event.info.find("display_name");
            if (name != event.info.end()) peer.display_name = name->second;
        }

        PeerContext& ctx = m_sm->context(peer);
        const bool was_visible = ctx.visible;
        FSMResult result = m_sm->m_fsm.handle_event(ctx, PeerEvent::FOUND);
        if (!was_visible) {
            m_sm->m_journal.info("Found peer " + ctx.peer.label());
        }

        if (!result.has(PeerAction::EVALUATE_INVITE)) {
            return;
        }
        if (m_sm->isSessionMember(ctx.peer)) {
            m_sm->m_journal.debug(ctx.peer.label() + " is already a session member");
            return;
        }
        if (!PeerReconnectPolicy::shouldInitiate(m_sm->m_identity.peer(), ctx.peer)) {
            m_sm->m_journal.info("Waiting for " + ctx.peer.label() + " to invite");
            return;
        }
        if (ctx.inviteOutstanding(std::chrono::steady_clock::now())) {
            m_sm->m_journal.debug("Invitation to " + ctx.peer.label() + " still outstanding");
            return;
        }
        m_sm->invitePeer(ctx, m_sm->m_settings.invite_timeout_sec, "discovered");
    }

    void DiscoveryHandler::handlePeerLost(const PeerLostEvent& event) {
        if (isStale(event.generation)) {
            LOG_DEBUG("SM: lost " + event.peer.id + " from a retired browser, ignored");
            return;
        }

        PeerContext* ctx = m_sm->findContext(event.peer.id);
        if (!ctx || !ctx->visible) {
            LOG_DEBUG("SM: lost " + event.peer.id + " which was not visible");
            return;
        }

        m_sm->m_fsm.handle_event(*ctx, PeerEvent::LOST);
        if (ctx->isMember()) {
            m_sm->m_journal.info("Lost peer " + ctx->peer.label() + " (session still active)");
        } else {
            m_sm->m_journal.info("Lost peer " + ctx->peer.label());
        }
        m_sm->pruneContext(event.peer.id);
    }

    void DiscoveryHandler::handleBrowsingFailed(const BrowsingFailedEvent& event) {
        if (isStale(event.generation)) {
            LOG_DEBUG("SM: browsing failure from a retired browser ignored: " + event.error);
            return;
        }
        m_sm->m_browsing = false;
        m_sm->resetVisibility();
        m_sm->m_journal.error("Browsing failed to start: " + event.error);
    }
}
