#include "peer_state_machine.h"
#include "logger.h"
#include <algorithm>

namespace {
    // Where a peer rests once it is no longer part of the session
    PeerState resting_state(const PeerContext& peer) {
        return peer.visible ? PeerState::DISCOVERED : PeerState::NOT_PRESENT;
    }
}

const char* session_state_to_string(SessionState state) {
    switch (state) {
        case SessionState::NOT_CONNECTED: return "NOT_CONNECTED";
        case SessionState::CONNECTING: return "CONNECTING";
        case SessionState::CONNECTED: return "CONNECTED";
        case SessionState::UNKNOWN: return "UNKNOWN";
    }
    return "UNKNOWN";
}

bool FSMResult::has(PeerAction action) const {
    return std::find(actions.begin(), actions.end(), action) != actions.end();
}

bool PeerContext::inviteOutstanding(std::chrono::steady_clock::time_point now) const {
    if (!invite_pending) {
        return false;
    }
    return now < last_invite_at + std::chrono::seconds(last_invite_timeout_sec);
}

// ==========================================================
// FSM ENTRY POINT
// ==========================================================
FSMResult PeerStateMachine::handle_event(PeerContext& peer, PeerEvent event) {
    const PeerState old_state = peer.state;

    FSMResult result = compute_transition(old_state, event, peer);

    if (result.new_state != old_state) {
        peer.state = result.new_state;
        peer.last_state_change = std::chrono::steady_clock::now();

        LOG_INFO(
            std::string("[PeerFSM] ") +
            state_to_string(old_state) +
            " --(" + event_to_string(event) + ")--> " +
            state_to_string(result.new_state) +
            " peer=" + peer.peer.id
        );
    } else if (result.has(PeerAction::LOG_STALE_EVENT)) {
        LOG_DEBUG(
            std::string("[PeerFSM] stale ") + event_to_string(event) +
            " in " + state_to_string(old_state) + " peer=" + peer.peer.id
        );
    }

    return result;
}

PeerEvent PeerStateMachine::event_for_session_state(SessionState state) {
    switch (state) {
        case SessionState::CONNECTING: return PeerEvent::SESSION_CONNECTING;
        case SessionState::CONNECTED: return PeerEvent::SESSION_CONNECTED;
        case SessionState::NOT_CONNECTED: return PeerEvent::SESSION_NOT_CONNECTED;
        case SessionState::UNKNOWN: break;
    }
    return PeerEvent::SESSION_UNKNOWN;
}

// ==========================================================
// TRANSITION TABLE
// ==========================================================
FSMResult PeerStateMachine::compute_transition(
    PeerState current,
    PeerEvent event,
    PeerContext& peer
) const {
    const bool member = current == PeerState::CONNECTING || current == PeerState::CONNECTED;

    switch (event) {

    // ------------------------------------------------------
    case PeerEvent::FOUND:
        peer.visible = true;
        // Already part of the session: nothing to decide
        if (member)
            return FSMResult(current);
        return FSMResult(PeerState::DISCOVERED, { PeerAction::EVALUATE_INVITE });

    // ------------------------------------------------------
    case PeerEvent::LOST:
        if (!peer.visible && !member)
            return FSMResult(current, { PeerAction::LOG_STALE_EVENT });
        peer.visible = false;
        // Discovery visibility and session membership are independent signals
        if (member)
            return FSMResult(current);
        return FSMResult(PeerState::NOT_PRESENT);

    // ------------------------------------------------------
    case PeerEvent::INVITATION_RECEIVED:
        return FSMResult(current, { PeerAction::ACCEPT_INVITATION, PeerAction::CANCEL_BACKUP_INVITE });

    // ------------------------------------------------------
    case PeerEvent::SESSION_CONNECTING:
        peer.invite_pending = false;
        return FSMResult(PeerState::CONNECTING, { PeerAction::REGISTER_PEER, PeerAction::CANCEL_BACKUP_INVITE });

    // ------------------------------------------------------
    case PeerEvent::SESSION_CONNECTED:
        peer.invite_pending = false;
        return FSMResult(PeerState::CONNECTED, { PeerAction::MARK_CONNECTED, PeerAction::CANCEL_BACKUP_INVITE });

    // ------------------------------------------------------
    case PeerEvent::SESSION_NOT_CONNECTED: {
        // An invitation that never reached connecting also resolves here
        peer.invite_pending = false;
        if (!member)
            return FSMResult(current, { PeerAction::LOG_STALE_EVENT });

        const bool unexpected = !peer.disconnect_requested;
        peer.disconnect_requested = false;
        if (unexpected && peer.visible)
            return FSMResult(resting_state(peer), { PeerAction::REMOVE_PEER, PeerAction::ATTEMPT_RECONNECT });
        return FSMResult(resting_state(peer), { PeerAction::REMOVE_PEER });
    }

    // ------------------------------------------------------
    case PeerEvent::SESSION_UNKNOWN:
        return FSMResult(current);

    // ------------------------------------------------------
    case PeerEvent::DISCONNECT_REQUESTED:
        if (member)
            peer.disconnect_requested = true;
        return FSMResult(current, { PeerAction::CANCEL_BACKUP_INVITE });

    // ------------------------------------------------------
    case PeerEvent::SESSION_RESET:
        peer.disconnect_requested = false;
        peer.invite_pending = false;
        return FSMResult(resting_state(peer), { PeerAction::CANCEL_BACKUP_INVITE });
    }

    LOG_WARN(
        std::string("[PeerFSM] Ignored event ") +
        event_to_string(event) +
        " in state " +
        state_to_string(current)
    );
    return FSMResult(current);
}

const char* PeerStateMachine::state_to_string(PeerState state) {
    switch (state) {
        case PeerState::NOT_PRESENT: return "NOT_PRESENT";
        case PeerState::DISCOVERED: return "DISCOVERED";
        case PeerState::CONNECTING: return "CONNECTING";
        case PeerState::CONNECTED: return "CONNECTED";
    }
    return "UNKNOWN_STATE";
}

const char* PeerStateMachine::event_to_string(PeerEvent event) {
    switch (event) {
        case PeerEvent::FOUND: return "FOUND";
        case PeerEvent::LOST: return "LOST";
        case PeerEvent::INVITATION_RECEIVED: return "INVITATION_RECEIVED";
        case PeerEvent::SESSION_CONNECTING: return "SESSION_CONNECTING";
        case PeerEvent::SESSION_CONNECTED: return "SESSION_CONNECTED";
        case PeerEvent::SESSION_NOT_CONNECTED: return "SESSION_NOT_CONNECTED";
        case PeerEvent::SESSION_UNKNOWN: return "SESSION_UNKNOWN";
        case PeerEvent::DISCONNECT_REQUESTED: return "DISCONNECT_REQUESTED";
        case PeerEvent::SESSION_RESET: return "SESSION_RESET";
    }
    return "UNKNOWN_EVENT";
}

const char* PeerStateMachine::action_to_string(PeerAction action) {
    switch (action) {
        case PeerAction::EVALUATE_INVITE: return "EVALUATE_INVITE";
        case PeerAction::ACCEPT_INVITATION: return "ACCEPT_INVITATION";
        case PeerAction::REGISTER_PEER: return "REGISTER_PEER";
        case PeerAction::MARK_CONNECTED: return "MARK_CONNECTED";
        case PeerAction::REMOVE_PEER: return "REMOVE_PEER";
        case PeerAction::ATTEMPT_RECONNECT: return "ATTEMPT_RECONNECT";
        case PeerAction::CANCEL_BACKUP_INVITE: return "CANCEL_BACKUP_INVITE";
        case PeerAction::LOG_STALE_EVENT: return "LOG_STALE_EVENT";
    }
    return "UNKNOWN_ACTION";
}
