#ifndef PEER_STATE_MACHINE_H
#define PEER_STATE_MACHINE_H

#include "peer_id.h"
#include "mesh_transport.h"
#include <chrono>
#include <string>
#include <vector>

// =======================================================
// Authoritative per-peer connection state
// =======================================================
enum class PeerState {
    NOT_PRESENT,    // Neither visible nor part of the session
    DISCOVERED,     // Visible through the browser, not part of the session
    CONNECTING,     // Session reported connecting; registered
    CONNECTED       // Session reported connected; registered
};

// =======================================================
// FSM Input Events (external stimuli only)
// =======================================================
enum class PeerEvent {
    FOUND,
    LOST,
    INVITATION_RECEIVED,
    SESSION_CONNECTING,
    SESSION_CONNECTED,
    SESSION_NOT_CONNECTED,
    SESSION_UNKNOWN,
    DISCONNECT_REQUESTED,
    SESSION_RESET
};

// =======================================================
// FSM Output Actions (intents only, no side effects here)
// =======================================================
enum class PeerAction {
    EVALUATE_INVITE,
    ACCEPT_INVITATION,
    REGISTER_PEER,
    MARK_CONNECTED,
    REMOVE_PEER,
    ATTEMPT_RECONNECT,
    CANCEL_BACKUP_INVITE,
    LOG_STALE_EVENT
};

struct FSMResult {
    PeerState new_state;
    std::vector<PeerAction> actions;

    explicit FSMResult(PeerState state)
        : new_state(state) {}

    FSMResult(PeerState state, std::initializer_list<PeerAction> action_list)
        : new_state(state), actions(action_list) {}

    bool has(PeerAction action) const;
};

// =======================================================
// Peer Context (FSM-owned mutable state)
// =======================================================
// NOTE: the FSM updates visibility and the disconnect flag in place instead of
// returning a new context on every transition. The handlers own the invite
// bookkeeping fields.
struct PeerContext {
    PeerId peer;

    PeerState state = PeerState::NOT_PRESENT;

    // Discovery visibility is independent of the session state
    bool visible = false;

    // Set by an explicit disconnect so the following loss is not treated as unexpected
    bool disconnect_requested = false;

    // Outstanding invitation, if any
    bool invite_pending = false;
    std::chrono::steady_clock::time_point last_invite_at;
    int last_invite_timeout_sec = 0;

    std::chrono::steady_clock::time_point last_state_change;

    explicit PeerContext(PeerId p = PeerId())
        : peer(std::move(p)), last_state_change(std::chrono::steady_clock::now()) {}

    bool isMember() const {
        return state == PeerState::CONNECTING || state == PeerState::CONNECTED;
    }

    // True while an invitation sent at last_invite_at has not timed out
    bool inviteOutstanding(std::chrono::steady_clock::time_point now) const;
};

// =======================================================
// Peer State Machine (pure transition logic)
// =======================================================
class PeerStateMachine {
public:
    // (Context + Event) -> (New State + Actions)
    FSMResult handle_event(PeerContext& peer, PeerEvent event);

    static PeerEvent event_for_session_state(SessionState state);

    static const char* state_to_string(PeerState state);
    static const char* event_to_string(PeerEvent event);
    static const char* action_to_string(PeerAction action);

private:
    FSMResult compute_transition(PeerState current,
                                 PeerEvent event,
                                 PeerContext& peer) const;
};

#endif // PEER_STATE_MACHINE_H
