#ifndef MESH_TRANSPORT_H
#define MESH_TRANSPORT_H

#include "peer_id.h"
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <vector>

using Bytes = std::vector<uint8_t>;
using DiscoveryInfo = std::map<std::string, std::string>;

enum class SessionState {
    NOT_CONNECTED,
    CONNECTING,
    CONNECTED,
    UNKNOWN
};

const char* session_state_to_string(SessionState state);

// =======================================================
// Transport boundary
//
// Implementations raise their callbacks from threads they own, possibly
// concurrently. Callbacks must only be set before the object is started.
// =======================================================

// Encrypted session shared by all connected peers of the local node
class IMeshSession {
public:
    using StateCallback = std::function<void(const PeerId& peer, SessionState state)>;
    using DataCallback = std::function<void(const Bytes& data, const PeerId& from)>;

    virtual ~IMeshSession() = default;

    virtual void setCallbacks(StateCallback on_state, DataCallback on_data) = 0;

    // Best-effort, reliable-mode send. Returns false and fills *error when the
    // transport rejects the payload for any of the peers.
    virtual bool send(const Bytes& data, const std::vector<PeerId>& peers, std::string* error = nullptr) = 0;

    virtual void cancelConnectPeer(const PeerId& peer) = 0;
    virtual void disconnect() = 0;
    virtual std::vector<PeerId> connectedPeers() const = 0;
};

// accept + the session to join (nullptr when rejecting)
using InvitationHandler = std::function<void(bool accept, IMeshSession* session)>;

class IServiceBrowser {
public:
    using FoundCallback = std::function<void(const PeerId& peer, const DiscoveryInfo& info)>;
    using LostCallback = std::function<void(const PeerId& peer)>;
    using FailureCallback = std::function<void(const std::string& error)>;

    virtual ~IServiceBrowser() = default;

    virtual void setCallbacks(FoundCallback on_found, LostCallback on_lost, FailureCallback on_failed) = 0;
    // Start failures are reported asynchronously through the failure callback
    virtual void startBrowsing() = 0;
    virtual void stopBrowsing() = 0;
    virtual void invitePeer(const PeerId& peer, IMeshSession& session, const Bytes& context, int timeout_sec) = 0;
};

class IServiceAdvertiser {
public:
    using InvitationCallback = std::function<void(const PeerId& from, const Bytes& context, InvitationHandler handler)>;
    using FailureCallback = std::function<void(const std::string& error)>;

    virtual ~IServiceAdvertiser() = default;

    virtual void setCallbacks(InvitationCallback on_invitation, FailureCallback on_failed) = 0;
    virtual void startAdvertising() = 0;
    virtual void stopAdvertising() = 0;
};

#endif // MESH_TRANSPORT_H
