#include "loopback_medium.h"
#include "logger.h"

#include <stdexcept>

LoopbackMedium::LoopbackMedium() {
    m_dispatch_thread = std::thread([this] { dispatchLoop(); });
}

LoopbackMedium::~LoopbackMedium() {
    {
        std::lock_guard<std::mutex> lock(m_queue_mutex);
        m_stopping = true;
        m_queue.clear();
    }
    m_queue_cv.notify_all();
    m_idle_cv.notify_all();
    if (m_dispatch_thread.joinable()) {
        m_dispatch_thread.join();
    }
}

// =======================================================
// Dispatch
// =======================================================

void LoopbackMedium::post(Task task) {
    {
        std::lock_guard<std::mutex> lock(m_queue_mutex);
        if (m_stopping) return;
        m_queue.push_back(std::move(task));
    }
    m_queue_cv.notify_one();
}

void LoopbackMedium::dispatchLoop() {
    while (true) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(m_queue_mutex);
            m_queue_cv.wait(lock, [this] { return m_stopping || !m_queue.empty(); });
            if (m_stopping) break;
            task = std::move(m_queue.front());
            m_queue.pop_front();
            m_busy = true;
        }

        {
            std::lock_guard<std::recursive_mutex> dispatch(m_dispatch_mutex);
            try {
                task();
            } catch (const std::exception& e) {
                LOG_WARN("Loopback: callback threw: " + std::string(e.what()));
            }
        }

        {
            std::lock_guard<std::mutex> lock(m_queue_mutex);
            m_busy = false;
            if (m_queue.empty()) {
                m_idle_cv.notify_all();
            }
        }
    }
}

bool LoopbackMedium::waitIdle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(m_queue_mutex);
    return m_idle_cv.wait_for(lock, timeout, [this] { return m_stopping || (m_queue.empty() && !m_busy); });
}

void LoopbackMedium::queueSessionState(const std::string& target_id, const PeerId& peer, SessionState state) {
    post([this, target_id, peer, state]() {
        IMeshSession::StateCallback callback;
        {
            std::lock_guard<std::mutex> lock(m_state_mutex);
            auto by_id = m_session_by_id.find(target_id);
            if (by_id == m_session_by_id.end()) return;
            auto it = m_sessions.find(by_id->second);
            if (it == m_sessions.end()) return;
            callback = it->second.on_state;
        }
        if (callback) callback(peer, state);
    });
}

void LoopbackMedium::queueData(const std::string& target_id, const Bytes& data, const PeerId& from) {
    post([this, target_id, data, from]() {
        IMeshSession::DataCallback callback;
        {
            std::lock_guard<std::mutex> lock(m_state_mutex);
            auto by_id = m_session_by_id.find(target_id);
            if (by_id == m_session_by_id.end()) return;
            auto it = m_sessions.find(by_id->second);
            if (it == m_sessions.end()) return;
            callback = it->second.on_data;
        }
        if (callback) callback(data, from);
    });
}

// =======================================================
// Links
// =======================================================

LoopbackMedium::LinkKey LoopbackMedium::linkKey(const std::string& a, const std::string& b) {
    return a < b ? LinkKey(a, b) : LinkKey(b, a);
}

PeerId LoopbackMedium::peerLocked(const std::string& id) const {
    auto by_id = m_session_by_id.find(id);
    if (by_id != m_session_by_id.end()) {
        auto it = m_sessions.find(by_id->second);
        if (it != m_sessions.end()) return it->second.self;
    }
    return PeerId(id);
}

void LoopbackMedium::unlinkLocked(const PeerId& a, const PeerId& b) {
    if (m_links.erase(linkKey(a.id, b.id)) == 0) return;
    LOG_DEBUG("Loopback: link " + a.id + " <-> " + b.id + " closed");
    queueSessionState(a.id, b, SessionState::NOT_CONNECTED);
    queueSessionState(b.id, a, SessionState::NOT_CONNECTED);
}

bool LoopbackMedium::dropLink(const std::string& a, const std::string& b) {
    std::lock_guard<std::mutex> lock(m_state_mutex);
    if (!m_links.count(linkKey(a, b))) return false;
    unlinkLocked(peerLocked(a), peerLocked(b));
    return true;
}

bool LoopbackMedium::isLinked(const std::string& a, const std::string& b) const {
    std::lock_guard<std::mutex> lock(m_state_mutex);
    return m_links.count(linkKey(a, b)) > 0;
}

size_t LoopbackMedium::invitationCount() const {
    std::lock_guard<std::mutex> lock(m_state_mutex);
    size_t total = 0;
    for (const auto& entry : m_invitations) {
        total += entry.second;
    }
    return total;
}

size_t LoopbackMedium::invitationCount(const std::string& from, const std::string& to) const {
    std::lock_guard<std::mutex> lock(m_state_mutex);
    auto it = m_invitations.find(std::make_pair(from, to));
    return it == m_invitations.end() ? 0 : it->second;
}

// =======================================================
// Visibility
// =======================================================

const LoopbackMedium::AdvertiserEntry* LoopbackMedium::findAdvertiserLocked(const std::string& owner_id,
                                                                            const std::string& service_type) const {
    for (const auto& [handle, advertiser] : m_advertisers) {
        if (advertiser.advertising && advertiser.owner.id == owner_id && advertiser.service_type == service_type) {
            return &advertiser;
        }
    }
    return nullptr;
}

void LoopbackMedium::refreshVisibilityLocked() {
    for (auto& [handle, browser] : m_browsers) {
        if (!browser.browsing) continue;

        std::map<std::string, std::pair<PeerId, DiscoveryInfo>> visible;
        if (!m_hidden.count(browser.owner.id)) {
            for (const auto& [adv_handle, advertiser] : m_advertisers) {
                if (!advertiser.advertising || advertiser.service_type != browser.service_type) continue;
                if (advertiser.owner.id == browser.owner.id || m_hidden.count(advertiser.owner.id)) continue;
                visible.emplace(advertiser.owner.id, std::make_pair(advertiser.owner, advertiser.info));
            }
        }

        const uint64_t browser_handle = handle;
        for (auto it = browser.seen.begin(); it != browser.seen.end();) {
            if (visible.count(it->first)) {
                ++it;
                continue;
            }
            const PeerId lost = it->second;
            it = browser.seen.erase(it);
            post([this, browser_handle, lost]() {
                IServiceBrowser::LostCallback callback;
                {
                    std::lock_guard<std::mutex> lock(m_state_mutex);
                    auto b = m_browsers.find(browser_handle);
                    if (b == m_browsers.end() || !b->second.browsing) return;
                    callback = b->second.on_lost;
                }
                if (callback) callback(lost);
            });
        }

        for (const auto& [id, found] : visible) {
            if (!browser.seen.emplace(id, found.first).second) continue;
            const PeerId peer = found.first;
            const DiscoveryInfo info = found.second;
            post([this, browser_handle, peer, info]() {
                IServiceBrowser::FoundCallback callback;
                {
                    std::lock_guard<std::mutex> lock(m_state_mutex);
                    auto b = m_browsers.find(browser_handle);
                    if (b == m_browsers.end() || !b->second.browsing) return;
                    callback = b->second.on_found;
                }
                if (callback) callback(peer, info);
            });
        }
    }
}

void LoopbackMedium::setVisible(const std::string& peer_id, bool visible) {
    std::lock_guard<std::mutex> lock(m_state_mutex);
    if (visible) {
        m_hidden.erase(peer_id);
    } else {
        m_hidden.insert(peer_id);
    }
    refreshVisibilityLocked();
}

void LoopbackMedium::failBrowsing(const std::string& peer_id, const std::string& error) {
    std::lock_guard<std::mutex> lock(m_state_mutex);
    for (auto& [handle, browser] : m_browsers) {
        if (!browser.browsing || browser.owner.id != peer_id) continue;
        browser.browsing = false;
        browser.seen.clear();
        const uint64_t browser_handle = handle;
        post([this, browser_handle, error]() {
            IServiceBrowser::FailureCallback callback;
            {
                std::lock_guard<std::mutex> lock(m_state_mutex);
                auto it = m_browsers.find(browser_handle);
                if (it == m_browsers.end()) return;
                callback = it->second.on_failed;
            }
            if (callback) callback(error);
        });
    }
}

void LoopbackMedium::failAdvertising(const std::string& peer_id, const std::string& error) {
    std::lock_guard<std::mutex> lock(m_state_mutex);
    bool changed = false;
    for (auto& [handle, advertiser] : m_advertisers) {
        if (!advertiser.advertising || advertiser.owner.id != peer_id) continue;
        advertiser.advertising = false;
        changed = true;
        const uint64_t adv_handle = handle;
        post([this, adv_handle, error]() {
            IServiceAdvertiser::FailureCallback callback;
            {
                std::lock_guard<std::mutex> lock(m_state_mutex);
                auto it = m_advertisers.find(adv_handle);
                if (it == m_advertisers.end()) return;
                callback = it->second.on_failed;
            }
            if (callback) callback(error);
        });
    }
    if (changed) refreshVisibilityLocked();
}

// =======================================================
// Sessions
// =======================================================

uint64_t LoopbackMedium::registerSession(const IMeshSession* object, const PeerId& self) {
    std::lock_guard<std::mutex> lock(m_state_mutex);
    const uint64_t handle = m_next_handle++;
    SessionEntry entry;
    entry.self = self;
    entry.object = object;
    m_sessions[handle] = std::move(entry);
    m_session_by_id[self.id] = handle;
    return handle;
}

void LoopbackMedium::unregisterSession(uint64_t handle) {
    std::lock_guard<std::recursive_mutex> dispatch(m_dispatch_mutex);
    std::lock_guard<std::mutex> lock(m_state_mutex);
    auto it = m_sessions.find(handle);
    if (it == m_sessions.end()) return;
    const PeerId self = it->second.self;
    m_sessions.erase(it);

    auto by_id = m_session_by_id.find(self.id);
    if (by_id != m_session_by_id.end() && by_id->second == handle) {
        m_session_by_id.erase(by_id);
        std::vector<LinkKey> links(m_links.begin(), m_links.end());
        for (const auto& link : links) {
            if (link.first == self.id) unlinkLocked(self, peerLocked(link.second));
            else if (link.second == self.id) unlinkLocked(self, peerLocked(link.first));
        }
    }
}

void LoopbackMedium::setSessionCallbacks(uint64_t handle, IMeshSession::StateCallback on_state,
                                         IMeshSession::DataCallback on_data) {
    std::lock_guard<std::mutex> lock(m_state_mutex);
    auto it = m_sessions.find(handle);
    if (it == m_sessions.end()) return;
    it->second.on_state = std::move(on_state);
    it->second.on_data = std::move(on_data);
}

bool LoopbackMedium::send(uint64_t handle, const Bytes& data, const std::vector<PeerId>& peers, std::string* error) {
    std::lock_guard<std::mutex> lock(m_state_mutex);
    auto it = m_sessions.find(handle);
    if (it == m_sessions.end()) {
        if (error) *error = "session closed";
        return false;
    }
    if (peers.empty()) {
        if (error) *error = "no recipients";
        return false;
    }

    const PeerId self = it->second.self;
    for (const auto& peer : peers) {
        if (!m_links.count(linkKey(self.id, peer.id))) {
            if (error) *error = "not connected to " + peer.id;
            return false;
        }
    }
    for (const auto& peer : peers) {
        queueData(peer.id, data, self);
    }
    return true;
}

void LoopbackMedium::cancelConnect(uint64_t handle, const PeerId& peer) {
    std::lock_guard<std::mutex> lock(m_state_mutex);
    auto it = m_sessions.find(handle);
    if (it == m_sessions.end()) return;
    const PeerId self = it->second.self;

    if (m_links.count(linkKey(self.id, peer.id))) {
        unlinkLocked(self, peerLocked(peer.id));
    } else {
        queueSessionState(self.id, peer, SessionState::NOT_CONNECTED);
    }
}

void LoopbackMedium::disconnectAll(uint64_t handle) {
    std::lock_guard<std::mutex> lock(m_state_mutex);
    auto it = m_sessions.find(handle);
    if (it == m_sessions.end()) return;
    const PeerId self = it->second.self;

    std::vector<LinkKey> links(m_links.begin(), m_links.end());
    for (const auto& link : links) {
        if (link.first == self.id) unlinkLocked(self, peerLocked(link.second));
        else if (link.second == self.id) unlinkLocked(self, peerLocked(link.first));
    }
}

std::vector<PeerId> LoopbackMedium::linkedPeers(uint64_t handle) const {
    std::lock_guard<std::mutex> lock(m_state_mutex);
    std::vector<PeerId> peers;
    auto it = m_sessions.find(handle);
    if (it == m_sessions.end()) return peers;
    const std::string& self = it->second.self.id;
    for (const auto& link : m_links) {
        if (link.first == self) peers.push_back(peerLocked(link.second));
        else if (link.second == self) peers.push_back(peerLocked(link.first));
    }
    return peers;
}

// =======================================================
// Browsers
// =======================================================

uint64_t LoopbackMedium::registerBrowser(const PeerId& owner, const std::string& service_type) {
    std::lock_guard<std::mutex> lock(m_state_mutex);
    const uint64_t handle = m_next_handle++;
    BrowserEntry entry;
    entry.owner = owner;
    entry.service_type = service_type;
    m_browsers[handle] = std::move(entry);
    return handle;
}

void LoopbackMedium::unregisterBrowser(uint64_t handle) {
    std::lock_guard<std::recursive_mutex> dispatch(m_dispatch_mutex);
    std::lock_guard<std::mutex> lock(m_state_mutex);
    m_browsers.erase(handle);
}

void LoopbackMedium::setBrowserCallbacks(uint64_t handle, IServiceBrowser::FoundCallback on_found,
                                         IServiceBrowser::LostCallback on_lost,
                                         IServiceBrowser::FailureCallback on_failed) {
    std::lock_guard<std::mutex> lock(m_state_mutex);
    auto it = m_browsers.find(handle);
    if (it == m_browsers.end()) return;
    it->second.on_found = std::move(on_found);
    it->second.on_lost = std::move(on_lost);
    it->second.on_failed = std::move(on_failed);
}

void LoopbackMedium::setBrowsing(uint64_t handle, bool browsing) {
    std::lock_guard<std::mutex> lock(m_state_mutex);
    auto it = m_browsers.find(handle);
    if (it == m_browsers.end() || it->second.browsing == browsing) return;
    it->second.browsing = browsing;
    if (browsing) {
        refreshVisibilityLocked();
    } else {
        it->second.seen.clear();
    }
}

void LoopbackMedium::invite(uint64_t browser_handle, const PeerId& target, const Bytes& context) {
    std::lock_guard<std::mutex> lock(m_state_mutex);
    auto b = m_browsers.find(browser_handle);
    if (b == m_browsers.end()) return;
    const PeerId inviter = b->second.owner;
    ++m_invitations[std::make_pair(inviter.id, target.id)];

    const AdvertiserEntry* advertiser = findAdvertiserLocked(target.id, b->second.service_type);
    if (!advertiser || m_hidden.count(target.id) || m_hidden.count(inviter.id)) {
        LOG_DEBUG("Loopback: " + target.id + " unreachable, invitation from " + inviter.id + " fails");
        queueSessionState(inviter.id, target, SessionState::NOT_CONNECTED);
        return;
    }

    uint64_t adv_handle = 0;
    for (const auto& [handle, entry] : m_advertisers) {
        if (&entry == advertiser) adv_handle = handle;
    }
    const PeerId invitee = advertiser->owner;
    queueSessionState(inviter.id, invitee, SessionState::CONNECTING);

    // Answered on whatever thread the advertiser's owner chooses
    InvitationHandler handler = [this, inviter, invitee](bool accept, IMeshSession* session) {
        answerInvitation(inviter, invitee, accept, session);
    };

    post([this, adv_handle, inviter, invitee, context, handler]() {
        IServiceAdvertiser::InvitationCallback callback;
        {
            std::lock_guard<std::mutex> lock(m_state_mutex);
            auto it = m_advertisers.find(adv_handle);
            if (it == m_advertisers.end() || !it->second.advertising || !it->second.on_invitation) {
                queueSessionState(inviter.id, invitee, SessionState::NOT_CONNECTED);
                return;
            }
            callback = it->second.on_invitation;
        }
        callback(inviter, context, handler);
    });
}

void LoopbackMedium::answerInvitation(const PeerId& inviter, const PeerId& invitee, bool accept,
                                      IMeshSession* session) {
    std::lock_guard<std::mutex> lock(m_state_mutex);
    if (!accept || session == nullptr) {
        LOG_DEBUG("Loopback: " + invitee.id + " declined invitation from " + inviter.id);
        queueSessionState(inviter.id, invitee, SessionState::NOT_CONNECTED);
        return;
    }

    const SessionEntry* joining = nullptr;
    for (const auto& [handle, entry] : m_sessions) {
        if (entry.object == session) joining = &entry;
    }
    if (!joining || joining->self.id != invitee.id) {
        LOG_WARN("Loopback: invitation from " + inviter.id + " accepted with a foreign session");
        queueSessionState(inviter.id, invitee, SessionState::NOT_CONNECTED);
        return;
    }
    if (!m_session_by_id.count(inviter.id)) {
        LOG_DEBUG("Loopback: inviter " + inviter.id + " has no session any more");
        return;
    }

    m_links.insert(linkKey(inviter.id, invitee.id));
    const PeerId inviter_peer = peerLocked(inviter.id);
    const PeerId invitee_peer = joining->self;
    LOG_DEBUG("Loopback: link " + inviter.id + " <-> " + invitee.id + " established");

    queueSessionState(invitee.id, inviter_peer, SessionState::CONNECTING);
    queueSessionState(inviter.id, invitee_peer, SessionState::CONNECTED);
    queueSessionState(invitee.id, inviter_peer, SessionState::CONNECTED);
}

// =======================================================
// Advertisers
// =======================================================

uint64_t LoopbackMedium::registerAdvertiser(const PeerId& owner, const std::string& service_type,
                                            const DiscoveryInfo& info) {
    std::lock_guard<std::mutex> lock(m_state_mutex);
    const uint64_t handle = m_next_handle++;
    AdvertiserEntry entry;
    entry.owner = owner;
    entry.service_type = service_type;
    entry.info = info;
    m_advertisers[handle] = std::move(entry);
    return handle;
}

void LoopbackMedium::unregisterAdvertiser(uint64_t handle) {
    std::lock_guard<std::recursive_mutex> dispatch(m_dispatch_mutex);
    std::lock_guard<std::mutex> lock(m_state_mutex);
    auto it = m_advertisers.find(handle);
    if (it == m_advertisers.end()) return;
    const bool was_advertising = it->second.advertising;
    m_advertisers.erase(it);
    if (was_advertising) refreshVisibilityLocked();
}

void LoopbackMedium::setAdvertiserCallbacks(uint64_t handle, IServiceAdvertiser::InvitationCallback on_invitation,
                                            IServiceAdvertiser::FailureCallback on_failed) {
    std::lock_guard<std::mutex> lock(m_state_mutex);
    auto it = m_advertisers.find(handle);
    if (it == m_advertisers.end()) return;
    it->second.on_invitation = std::move(on_invitation);
    it->second.on_failed = std::move(on_failed);
}

void LoopbackMedium::setAdvertising(uint64_t handle, bool advertising) {
    std::lock_guard<std::mutex> lock(m_state_mutex);
    auto it = m_advertisers.find(handle);
    if (it == m_advertisers.end() || it->second.advertising == advertising) return;
    it->second.advertising = advertising;
    refreshVisibilityLocked();
}
