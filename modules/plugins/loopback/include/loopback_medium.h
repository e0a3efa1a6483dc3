#ifndef LOOPBACK_MEDIUM_H
#define LOOPBACK_MEDIUM_H

#include "mesh_transport.h"
#include "session_dependencies.h"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <utility>
#include <vector>

class LoopbackSession;
class LoopbackBrowser;
class LoopbackAdvertiser;

/**
 * @brief In-process stand-in for the nearby radio, shared by every node of a
 * simulation or test.
 *
 * Nodes see each other when one is browsing and the other advertising the
 * same service type. Invitations are answered by the advertiser's callback;
 * an accepted invitation links the two sessions. All callbacks are raised
 * from one dispatch thread owned by the medium. A transport object that has
 * been destroyed never receives another callback.
 */
class LoopbackMedium {
public:
    LoopbackMedium();
    ~LoopbackMedium();

    LoopbackMedium(const LoopbackMedium&) = delete;
    LoopbackMedium& operator=(const LoopbackMedium&) = delete;

    // Severs the link as if the radio connection dropped. Both sides see
    // NOT_CONNECTED. Returns false if the nodes were not linked.
    bool dropLink(const std::string& a, const std::string& b);

    // A hidden node neither sees nor is seen by anyone. Existing links stay.
    void setVisible(const std::string& peer_id, bool visible);

    // Reports a failure to every active browser/advertiser of the node and
    // stops it.
    void failBrowsing(const std::string& peer_id, const std::string& error);
    void failAdvertising(const std::string& peer_id, const std::string& error);

    bool isLinked(const std::string& a, const std::string& b) const;
    size_t invitationCount() const;
    size_t invitationCount(const std::string& from, const std::string& to) const;

    // Waits until the dispatch queue is empty and no callback is running
    bool waitIdle(std::chrono::milliseconds timeout);

private:
    friend class LoopbackSession;
    friend class LoopbackBrowser;
    friend class LoopbackAdvertiser;

    using Task = std::function<void()>;
    using LinkKey = std::pair<std::string, std::string>;

    struct SessionEntry {
        PeerId self;
        const IMeshSession* object = nullptr;
        IMeshSession::StateCallback on_state;
        IMeshSession::DataCallback on_data;
    };

    struct BrowserEntry {
        PeerId owner;
        std::string service_type;
        bool browsing = false;
        std::map<std::string, PeerId> seen;
        IServiceBrowser::FoundCallback on_found;
        IServiceBrowser::LostCallback on_lost;
        IServiceBrowser::FailureCallback on_failed;
    };

    struct AdvertiserEntry {
        PeerId owner;
        std::string service_type;
        DiscoveryInfo info;
        bool advertising = false;
        IServiceAdvertiser::InvitationCallback on_invitation;
        IServiceAdvertiser::FailureCallback on_failed;
    };

    // ---- Used by the transport objects ----
    uint64_t registerSession(const IMeshSession* object, const PeerId& self);
    void unregisterSession(uint64_t handle);
    void setSessionCallbacks(uint64_t handle, IMeshSession::StateCallback on_state, IMeshSession::DataCallback on_data);
    bool send(uint64_t handle, const Bytes& data, const std::vector<PeerId>& peers, std::string* error);
    void cancelConnect(uint64_t handle, const PeerId& peer);
    void disconnectAll(uint64_t handle);
    std::vector<PeerId> linkedPeers(uint64_t handle) const;

    uint64_t registerBrowser(const PeerId& owner, const std::string& service_type);
    void unregisterBrowser(uint64_t handle);
    void setBrowserCallbacks(uint64_t handle, IServiceBrowser::FoundCallback on_found,
                             IServiceBrowser::LostCallback on_lost, IServiceBrowser::FailureCallback on_failed);
    void setBrowsing(uint64_t handle, bool browsing);
    void invite(uint64_t browser_handle, const PeerId& target, const Bytes& context);

    uint64_t registerAdvertiser(const PeerId& owner, const std::string& service_type, const DiscoveryInfo& info);
    void unregisterAdvertiser(uint64_t handle);
    void setAdvertiserCallbacks(uint64_t handle, IServiceAdvertiser::InvitationCallback on_invitation,
                                IServiceAdvertiser::FailureCallback on_failed);
    void setAdvertising(uint64_t handle, bool advertising);

    void answerInvitation(const PeerId& inviter, const PeerId& invitee, bool accept, IMeshSession* session);

    // ---- m_state_mutex held ----
    static LinkKey linkKey(const std::string& a, const std::string& b);
    PeerId peerLocked(const std::string& id) const;
    const AdvertiserEntry* findAdvertiserLocked(const std::string& owner_id, const std::string& service_type) const;
    void refreshVisibilityLocked();
    void unlinkLocked(const PeerId& a, const PeerId& b);
    void queueSessionState(const std::string& target_id, const PeerId& peer, SessionState state);
    void queueData(const std::string& target_id, const Bytes& data, const PeerId& from);

    void post(Task task);
    void dispatchLoop();

    mutable std::mutex m_state_mutex;
    std::map<uint64_t, SessionEntry> m_sessions;
    std::map<std::string, uint64_t> m_session_by_id;
    std::map<uint64_t, BrowserEntry> m_browsers;
    std::map<uint64_t, AdvertiserEntry> m_advertisers;
    std::set<LinkKey> m_links;
    std::set<std::string> m_hidden;
    std::map<std::pair<std::string, std::string>, size_t> m_invitations;
    uint64_t m_next_handle{1};

    // Held while a callback runs; transport objects take it before unregistering
    std::recursive_mutex m_dispatch_mutex;

    std::mutex m_queue_mutex;
    std::condition_variable m_queue_cv;
    std::condition_variable m_idle_cv;
    std::deque<Task> m_queue;
    bool m_busy{false};
    bool m_stopping{false};
    std::thread m_dispatch_thread;
};

// Transport factory whose sessions, browsers and advertisers live on a shared
// LoopbackMedium
class LoopbackTransportFactory : public IMeshTransportFactory {
public:
    explicit LoopbackTransportFactory(std::shared_ptr<LoopbackMedium> medium);

    std::unique_ptr<IMeshSession> createSession(const LocalIdentity& identity) override;
    std::unique_ptr<IServiceBrowser> createBrowser(const LocalIdentity& identity,
                                                   const std::string& service_type) override;
    std::unique_ptr<IServiceAdvertiser> createAdvertiser(const LocalIdentity& identity,
                                                         const std::string& service_type,
                                                         const DiscoveryInfo& info) override;

    const std::shared_ptr<LoopbackMedium>& medium() const { return m_medium; }

private:
    std::shared_ptr<LoopbackMedium> m_medium;
};

#endif // LOOPBACK_MEDIUM_H
