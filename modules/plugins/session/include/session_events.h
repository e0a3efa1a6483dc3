#ifndef SESSION_EVENTS_H
#define SESSION_EVENTS_H

#include "mesh_transport.h"
#include "lifecycle_notifier.h"
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

// Browser and advertiser events carry the generation of the service instance
// that raised them, so events of a torn-down instance can be told apart.

// --- Discovery funnel ---
struct PeerFoundEvent {
    PeerId peer;
    DiscoveryInfo info;
    uint64_t generation = 0;
};

struct PeerLostEvent {
    PeerId peer;
    uint64_t generation = 0;
};

struct BrowsingFailedEvent {
    std::string error;
    uint64_t generation = 0;
};

using DiscoveryEvent = std::variant<PeerFoundEvent, PeerLostEvent, BrowsingFailedEvent>;

// --- Advertising funnel ---
struct InvitationReceivedEvent {
    PeerId peer;
    Bytes context;
    InvitationHandler handler;
    uint64_t generation = 0;
};

struct AdvertisingFailedEvent {
    std::string error;
    uint64_t generation = 0;
};

using AdvertisingEvent = std::variant<InvitationReceivedEvent, AdvertisingFailedEvent>;

// --- Session state funnel ---
struct SessionStateEvent {
    PeerId peer;
    SessionState state = SessionState::UNKNOWN;
};

// --- Data received funnel ---
struct DataReceivedEvent {
    Bytes data;
    PeerId peer;
};

// --- Control funnel (UI commands) ---
// std::nullopt toggles the current value
struct SetBrowsingCommand {
    std::optional<bool> enable;
};

struct SetAdvertisingCommand {
    std::optional<bool> enable;
};

struct TogglePeerSelectionCommand {
    std::string peer_id;
};

struct SendDataCommand {
    Bytes data;
};

struct DisconnectPeerCommand {
    std::string peer_id;
};

struct DisconnectSessionCommand {};

struct ClearLogsCommand {};

struct SetDisconnectInBackgroundCommand {
    bool enabled = false;
};

using ControlEvent = std::variant<SetBrowsingCommand,
                                  SetAdvertisingCommand,
                                  TogglePeerSelectionCommand,
                                  SendDataCommand,
                                  DisconnectPeerCommand,
                                  DisconnectSessionCommand,
                                  ClearLogsCommand,
                                  SetDisconnectInBackgroundCommand>;

// --- App lifecycle funnel ---
struct AppLifecycleEvent {
    AppTransition transition = AppTransition::ENTERED_FOREGROUND;
};

#endif // SESSION_EVENTS_H
