#include "loopback_medium.h"
#include "local_identity.h"
#include "logger.h"

#include <stdexcept>

// Thin handles; all state lives in the medium so that a destroyed object
// drops out of the dispatch path atomically.

class LoopbackSession : public IMeshSession {
public:
    LoopbackSession(std::shared_ptr<LoopbackMedium> medium, const PeerId& self)
        : m_medium(std::move(medium)), m_handle(m_medium->registerSession(this, self)) {}

    ~LoopbackSession() override { m_medium->unregisterSession(m_handle); }

    void setCallbacks(StateCallback on_state, DataCallback on_data) override {
        m_medium->setSessionCallbacks(m_handle, std::move(on_state), std::move(on_data));
    }

    bool send(const Bytes& data, const std::vector<PeerId>& peers, std::string* error) override {
        return m_medium->send(m_handle, data, peers, error);
    }

    void cancelConnectPeer(const PeerId& peer) override { m_medium->cancelConnect(m_handle, peer); }
    void disconnect() override { m_medium->disconnectAll(m_handle); }
    std::vector<PeerId> connectedPeers() const override { return m_medium->linkedPeers(m_handle); }

private:
    std::shared_ptr<LoopbackMedium> m_medium;
    uint64_t m_handle;
};

class LoopbackBrowser : public IServiceBrowser {
public:
    LoopbackBrowser(std::shared_ptr<LoopbackMedium> medium, const PeerId& owner, const std::string& service_type)
        : m_medium(std::move(medium)), m_handle(m_medium->registerBrowser(owner, service_type)) {}

    ~LoopbackBrowser() override { m_medium->unregisterBrowser(m_handle); }

    void setCallbacks(FoundCallback on_found, LostCallback on_lost, FailureCallback on_failed) override {
        m_medium->setBrowserCallbacks(m_handle, std::move(on_found), std::move(on_lost), std::move(on_failed));
    }

    void startBrowsing() override { m_medium->setBrowsing(m_handle, true); }
    void stopBrowsing() override { m_medium->setBrowsing(m_handle, false); }

    // The loopback answers at once, so the timeout never fires
    void invitePeer(const PeerId& peer, IMeshSession&, const Bytes& context, int) override {
        m_medium->invite(m_handle, peer, context);
    }

private:
    std::shared_ptr<LoopbackMedium> m_medium;
    uint64_t m_handle;
};

class LoopbackAdvertiser : public IServiceAdvertiser {
public:
    LoopbackAdvertiser(std::shared_ptr<LoopbackMedium> medium, const PeerId& owner,
                       const std::string& service_type, const DiscoveryInfo& info)
        : m_medium(std::move(medium)), m_handle(m_medium->registerAdvertiser(owner, service_type, info)) {}

    ~LoopbackAdvertiser() override { m_medium->unregisterAdvertiser(m_handle); }

    void setCallbacks(InvitationCallback on_invitation, FailureCallback on_failed) override {
        m_medium->setAdvertiserCallbacks(m_handle, std::move(on_invitation), std::move(on_failed));
    }

    void startAdvertising() override { m_medium->setAdvertising(m_handle, true); }
    void stopAdvertising() override { m_medium->setAdvertising(m_handle, false); }

private:
    std::shared_ptr<LoopbackMedium> m_medium;
    uint64_t m_handle;
};

LoopbackTransportFactory::LoopbackTransportFactory(std::shared_ptr<LoopbackMedium> medium)
    : m_medium(std::move(medium)) {
    if (!m_medium) {
        throw std::invalid_argument("LoopbackTransportFactory: medium is null");
    }
}

std::unique_ptr<IMeshSession> LoopbackTransportFactory::createSession(const LocalIdentity& identity) {
    return std::make_unique<LoopbackSession>(m_medium, identity.peer());
}

std::unique_ptr<IServiceBrowser> LoopbackTransportFactory::createBrowser(const LocalIdentity& identity,
                                                                        const std::string& service_type) {
    LOG_DEBUG("Loopback: browser for " + identity.id() + " on " + service_type);
    return std::make_unique<LoopbackBrowser>(m_medium, identity.peer(), service_type);
}

std::unique_ptr<IServiceAdvertiser> LoopbackTransportFactory::createAdvertiser(const LocalIdentity& identity,
                                                                              const std::string& service_type,
                                                                              const DiscoveryInfo& info) {
    LOG_DEBUG("Loopback: advertiser for " + identity.id() + " on " + service_type);
    return std::make_unique<LoopbackAdvertiser>(m_medium, identity.peer(), service_type, info);
}
