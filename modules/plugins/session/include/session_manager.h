#ifndef SESSION_MANAGER_H
#define SESSION_MANAGER_H

#include "peer.h"
#include "local_identity.h"
#include "log_journal.h"
#include "mesh_transport.h"
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

class IMeshTransportFactory;
class ILifecycleNotifier;

// Read once at construction; immutable afterwards.
struct SessionSettings {
    std::string service_type;
    DiscoveryInfo discovery_info;
    bool auto_start = true;
    int invite_timeout_sec = 10;
    int reconnect_invite_timeout_sec = 5;
    std::chrono::milliseconds backup_invite_delay{3000};
    int max_reconnect_attempts = 0;
    std::chrono::milliseconds restart_debounce{500};
    bool disconnect_in_background = false;
    size_t log_journal_max_entries = 500;

    static SessionSettings fromConfig();
};

// Consistent copy of the UI-facing state, published after every handled event
struct MeshSnapshot {
    std::vector<RemotePeer> peers;
    bool is_running = false;
    bool is_browsing = false;
    bool is_advertising = false;
    bool in_background = false;
    bool disconnect_in_background = false;
};

/**
 * @brief Orchestrates discovery, invitations, reconnection and lifecycle for
 * the local node.
 *
 * Transport callbacks and UI commands are funneled onto one executor thread;
 * every public command below is thread-safe and returns immediately. Commands
 * issued while the manager is stopped are logged and dropped.
 */
class SessionManager {
public:
    using StateObserver = std::function<void(const MeshSnapshot&)>;

    SessionManager(LocalIdentity identity,
                   std::shared_ptr<IMeshTransportFactory> factory,
                   std::shared_ptr<ILifecycleNotifier> lifecycle,
                   SessionSettings settings = SessionSettings::fromConfig());
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    // Starts the executor and subscribes to lifecycle notifications. Also
    // starts browsing and advertising when settings.auto_start is set.
    bool start(std::string* error = nullptr);
    // Idempotent. Closes the funnels, stops the services and disconnects.
    void stop();
    bool isRunning() const;

    void startBroadcasting();
    void stopBroadcasting();
    void setBrowsing(bool enabled);
    void toggleBrowsing();
    void setAdvertising(bool enabled);
    void toggleAdvertising();

    void togglePeerSelection(const std::string& peer_id);
    void sendData(Bytes data);
    void sendTestPayload();
    void disconnectPeer(const std::string& peer_id);
    void disconnectSession();
    void clearLogs();
    void setDisconnectInBackground(bool enabled);

    MeshSnapshot snapshot() const;
    std::vector<LogEntry> logs() const;
    std::string reconnectStatusJson() const;

    // Invoked on the executor thread; must not call stop().
    void setStateObserver(StateObserver observer);
    void setLogObserver(std::function<void()> observer);

    const LocalIdentity& localIdentity() const;
    const SessionSettings& settings() const;

    class Impl;

private:
    std::unique_ptr<Impl> m_impl;
};

#endif // SESSION_MANAGER_H
