#include "peer_lifecycle_manager.h"
#include "session_manager_p.h"

#include <cstdio>

namespace {
    std::string format_seconds(std::chrono::system_clock::duration elapsed) {
        const double seconds = std::chrono::duration<double>(elapsed).count();
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%.2f", seconds);
        return buf;
    }
}

namespace detail {
    PeerLifecycleManager::PeerLifecycleManager(SessionManager::Impl* sm) : m_sm(sm) {}

    void PeerLifecycleManager::handleSessionState(const SessionStateEvent& event) {
        if (event.peer == m_sm->m_identity.peer()) {
            LOG_DEBUG("SM: session state for the local peer ignored");
            return;
        }

        const PeerEvent fsm_event = PeerStateMachine::event_for_session_state(event.state);
        if (fsm_event == PeerEvent::SESSION_UNKNOWN) {
            // No state change, so no bookkeeping for a peer seen for the first time
            PeerContext* known = m_sm->findContext(event.peer.id);
            if (known) {
                m_sm->m_fsm.handle_event(*known, fsm_event);
            }
            m_sm->m_journal.warn("Unknown session state reported for " +
                                 (known ? known->peer.label() : event.peer.label()));
            return;
        }

        PeerContext& ctx = m_sm->context(event.peer);
        FSMResult result = m_sm->m_fsm.handle_event(ctx, fsm_event);

        for (PeerAction action : result.actions) {
            switch (action) {
            case PeerAction::CANCEL_BACKUP_INVITE:
                if (m_sm->m_timers.cancel(TimerKind::BACKUP_INVITE, ctx.peer.id)) {
                    m_sm->m_journal.debug("Backup invite for " + ctx.peer.label() + " cancelled");
                }
                break;

            case PeerAction::REGISTER_PEER:
                m_sm->m_registry.addConnecting(ctx.peer);
                m_sm->m_journal.info("Connecting to " + ctx.peer.label());
                break;

            case PeerAction::MARK_CONNECTED: {
                auto first_seen = m_sm->m_registry.takeFirstSeen(ctx.peer.id);
                m_sm->m_registry.markConnected(ctx.peer);
                m_sm->m_policy.reset(ctx.peer.id);
                if (first_seen) {
                    m_sm->m_journal.info("Connected to " + ctx.peer.label() + " after " +
                                         format_seconds(std::chrono::system_clock::now() - *first_seen) + "s");
                } else {
                    m_sm->m_journal.info("Connected to " + ctx.peer.label());
                }
                break;
            }

            case PeerAction::REMOVE_PEER:
                m_sm->m_registry.remove(ctx.peer.id);
                m_sm->m_registry.clearFirstSeen(ctx.peer.id);
                m_sm->m_journal.info("Disconnected from " + ctx.peer.label());
                break;

            case PeerAction::ATTEMPT_RECONNECT:
                attemptReconnect(ctx);
                break;

            case PeerAction::LOG_STALE_EVENT:
                m_sm->m_journal.debug(std::string("Ignoring ") + session_state_to_string(event.state) +
                                      " for unregistered peer " + ctx.peer.label());
                break;

            case PeerAction::EVALUATE_INVITE:
            case PeerAction::ACCEPT_INVITATION:
                LOG_DEBUG(std::string("SM: ") + PeerStateMachine::action_to_string(action) +
                          " has no meaning for a session state, ignored");
                break;
            }
        }

        if (!ctx.isMember()) {
            m_sm->pruneContext(event.peer.id);
        }
    }

    void PeerLifecycleManager::handleDisconnectPeer(const std::string& peer_id) {
        PeerContext* ctx = m_sm->findContext(peer_id);
        if (!ctx || !ctx->isMember()) {
            m_sm->m_journal.warn("Disconnect ignored: " + peer_id + " is not connected");
            return;
        }

        // Expected loss: the reconnection policy stays out of it
        FSMResult result = m_sm->m_fsm.handle_event(*ctx, PeerEvent::DISCONNECT_REQUESTED);
        if (result.has(PeerAction::CANCEL_BACKUP_INVITE)) {
            m_sm->m_timers.cancel(TimerKind::BACKUP_INVITE, peer_id);
        }
        m_sm->m_journal.info("Disconnecting " + ctx->peer.label());
        m_sm->m_session->cancelConnectPeer(ctx->peer);
    }

    void PeerLifecycleManager::attemptReconnect(PeerContext& ctx) {
        ReconnectPlan plan = m_sm->m_policy.onConnectionLost(m_sm->m_identity.peer(), ctx.peer);
        if (plan.exhausted) {
            m_sm->m_journal.warn("Not reconnecting to " + ctx.peer.label() + ": " +
                                 std::to_string(plan.attempt) + " attempt(s) exhausted");
            return;
        }

        // Diagnostics for the "connected after" line
        m_sm->m_registry.recordFirstSeen(ctx.peer.id, std::chrono::system_clock::now());

        if (plan.initiate) {
            m_sm->m_journal.info("Reconnecting to " + ctx.peer.label() + " (attempt " + std::to_string(plan.attempt) + ")");
            m_sm->invitePeer(ctx, m_sm->m_settings.reconnect_invite_timeout_sec, "reconnect");
        } else {
            armBackupInvite(ctx.peer, plan.attempt);
        }
    }

    void PeerLifecycleManager::armBackupInvite(const PeerId& peer, int attempt) {
        const auto delay = m_sm->m_settings.backup_invite_delay;
        m_sm->m_journal.info("Waiting for " + peer.label() + " to reconnect, backup invite in " +
                             std::to_string(delay.count()) + "ms (attempt " + std::to_string(attempt) + ")");
        m_sm->armTimer(TimerKind::BACKUP_INVITE, peer.id, delay,
                       [this, peer]() { onBackupInviteFired(peer); });
    }

    void PeerLifecycleManager::onBackupInviteFired(const PeerId& peer) {
        PeerContext* ctx = m_sm->findContext(peer.id);
        if (!ctx || !ctx->visible) {
            m_sm->m_journal.info("Backup invite to " + peer.label() + " skipped: no longer discovered");
            if (ctx) m_sm->pruneContext(peer.id);
            return;
        }
        if (m_sm->m_registry.contains(peer.id) || m_sm->isSessionMember(peer)) {
            m_sm->m_journal.info("Backup invite to " + peer.label() + " skipped: already connected");
            return;
        }
        if (ctx->inviteOutstanding(std::chrono::steady_clock::now())) {
            m_sm->m_journal.debug("Backup invite to " + peer.label() + " skipped: invitation outstanding");
            return;
        }
        m_sm->invitePeer(*ctx, m_sm->m_settings.reconnect_invite_timeout_sec, "backup invite");
    }
}
