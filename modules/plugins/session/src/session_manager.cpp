#include "session_manager_p.h"
#include "config_manager.h"
#include <algorithm>
#include <stdexcept>
#include <type_traits>

SessionSettings SessionSettings::fromConfig() {
    const ConfigManager& config = ConfigManager::getInstance();
    SessionSettings s;
    s.service_type = config.getServiceType();
    s.auto_start = config.isAutoStart();
    s.invite_timeout_sec = std::max(1, config.getInviteTimeoutSec());
    s.reconnect_invite_timeout_sec = std::max(1, config.getReconnectInviteTimeoutSec());
    s.backup_invite_delay = std::chrono::milliseconds(std::max(0, config.getBackupInviteDelayMs()));
    s.max_reconnect_attempts = std::max(0, config.getMaxReconnectAttempts());
    s.restart_debounce = std::chrono::milliseconds(std::max(0, config.getRestartDebounceMs()));
    s.disconnect_in_background = config.isDisconnectInBackground();
    s.log_journal_max_entries = static_cast<size_t>(std::max(1, config.getLogJournalMaxEntries()));
    return s;
}

// =======================================================
// Impl
// =======================================================
SessionManager::Impl::Impl(LocalIdentity identity,
                           std::shared_ptr<IMeshTransportFactory> factory,
                           std::shared_ptr<ILifecycleNotifier> lifecycle,
                           SessionSettings settings)
    : m_identity(std::move(identity)),
      m_settings(std::move(settings)),
      m_factory(std::move(factory)),
      m_lifecycle(std::move(lifecycle)),
      m_journal(m_identity.displayName().empty() ? m_identity.id() : m_identity.displayName(),
                m_settings.log_journal_max_entries),
      m_policy(m_settings.max_reconnect_attempts),
      m_timers(m_event_manager.getUnifiedEventLoop()),
      m_disconnect_in_background(m_settings.disconnect_in_background),
      m_discovery_handler(this),
      m_advertising_handler(this),
      m_peer_lifecycle(this),
      m_message_handler(this),
      m_lifecycle_coordinator(this),
      m_discovery_funnel("discovery", m_event_manager.getUnifiedEventLoop(),
                         [this](const DiscoveryEvent& e) { m_discovery_handler.handle(e); publishSnapshot(); }),
      m_advertising_funnel("advertising", m_event_manager.getUnifiedEventLoop(),
                           [this](const AdvertisingEvent& e) { m_advertising_handler.handle(e); publishSnapshot(); }),
      m_session_state_funnel("session-state", m_event_manager.getUnifiedEventLoop(),
                             [this](const SessionStateEvent& e) { m_peer_lifecycle.handleSessionState(e); publishSnapshot(); }),
      m_data_funnel("data", m_event_manager.getUnifiedEventLoop(),
                    [this](const DataReceivedEvent& e) { m_message_handler.handleDataReceived(e); publishSnapshot(); }),
      m_control_funnel("control", m_event_manager.getUnifiedEventLoop(),
                       [this](const ControlEvent& e) { handleControl(e); publishSnapshot(); }),
      m_lifecycle_funnel("lifecycle", m_event_manager.getUnifiedEventLoop(),
                         [this](const AppLifecycleEvent& e) { m_lifecycle_coordinator.handle(e); publishSnapshot(); }) {
    if (!m_factory) {
        throw std::invalid_argument("SessionManager: transport factory is required");
    }
    if (m_settings.service_type.empty()) {
        throw std::invalid_argument("SessionManager: service type must not be empty");
    }

    m_session = m_factory->createSession(m_identity);
    if (!m_session) {
        throw std::runtime_error("SessionManager: transport factory returned no session");
    }

    // Transport threads only enqueue; everything else happens on the executor
    m_session->setCallbacks(
        [this](const PeerId& peer, SessionState state) {
            if (!m_session_state_funnel.push(SessionStateEvent{peer, state})) {
                LOG_DEBUG("SM: dropped session state " + std::string(session_state_to_string(state)) +
                          " for " + peer.id + " (not running)");
            }
        },
        [this](const Bytes& data, const PeerId& from) {
            if (!m_data_funnel.push(DataReceivedEvent{data, from})) {
                LOG_DEBUG("SM: dropped " + std::to_string(data.size()) + " byte(s) from " + from.id + " (not running)");
            }
        });

    m_snapshot.disconnect_in_background = m_disconnect_in_background;
}

SessionManager::Impl::~Impl() {
    stop();
}

bool SessionManager::Impl::start(std::string* error) {
    std::lock_guard<std::mutex> lock(m_start_stop_mutex);

    if (m_running.load(std::memory_order_acquire)) {
        m_journal.warn("Start ignored: already running");
        if (error) *error = "already running";
        return false;
    }

    m_discovery_funnel.open();
    m_advertising_funnel.open();
    m_session_state_funnel.open();
    m_data_funnel.open();
    m_control_funnel.open();
    m_lifecycle_funnel.open();

    m_event_manager.startEventProcessing();

    if (m_lifecycle) {
        m_lifecycle_token = m_lifecycle->subscribe([this](AppTransition transition) {
            if (!m_lifecycle_funnel.push(AppLifecycleEvent{transition})) {
                LOG_DEBUG(std::string("SM: dropped lifecycle transition ") + app_transition_to_string(transition));
            }
        });
    }

    m_running.store(true, std::memory_order_release);
    m_journal.info("Started as " + m_identity.peer().label() + " on service '" + m_settings.service_type + "'");

    if (m_settings.auto_start) {
        m_control_funnel.push(SetBrowsingCommand{true});
        m_control_funnel.push(SetAdvertisingCommand{true});
    } else {
        m_event_manager.getUnifiedEventLoop().post([this]() { publishSnapshot(); });
    }
    return true;
}

void SessionManager::Impl::stop() {
    std::lock_guard<std::mutex> lock(m_start_stop_mutex);

    if (!m_running.load(std::memory_order_acquire)) {
        return;
    }
    if (m_event_manager.getUnifiedEventLoop().isLoopThread()) {
        LOG_ERROR("SM: stop() called from the executor thread - ignored");
        return;
    }
    m_running.store(false, std::memory_order_release);

    if (m_lifecycle && m_lifecycle_token != 0) {
        m_lifecycle->unsubscribe(m_lifecycle_token);
        m_lifecycle_token = 0;
    }

    m_discovery_funnel.close();
    m_advertising_funnel.close();
    m_session_state_funnel.close();
    m_data_funnel.close();
    m_control_funnel.close();
    m_lifecycle_funnel.close();

    m_event_manager.stopEventProcessing();

    // The executor is gone; this thread is now the only writer
    m_timers.cancelAll();
    m_event_manager.getUnifiedEventLoop().clearScheduledTasks();
    stopBrowsingService();
    stopAdvertisingService();
    m_session->disconnect();

    m_registry.clear();
    m_registry.clearAllFirstSeen();
    m_contexts.clear();
    m_policy.resetAll();
    m_in_background = false;
    m_resume_browsing = false;
    m_resume_advertising = false;

    m_journal.info("Stopped");
    publishSnapshot();
}

void SessionManager::Impl::submit(ControlEvent command, const char* what) {
    if (!m_running.load(std::memory_order_acquire) || !m_control_funnel.push(std::move(command))) {
        m_journal.warn(std::string("Command '") + what + "' ignored: not running");
    }
}

MeshSnapshot SessionManager::Impl::snapshot() const {
    std::lock_guard<std::mutex> lock(m_snapshot_mutex);
    return m_snapshot;
}

void SessionManager::Impl::setStateObserver(StateObserver observer) {
    std::lock_guard<std::mutex> lock(m_observer_mutex);
    m_state_observer = std::move(observer);
}

void SessionManager::Impl::publishSnapshot() {
    MeshSnapshot snap;
    snap.peers = m_registry.list();
    snap.is_running = m_running.load(std::memory_order_acquire);
    snap.is_browsing = m_browsing;
    snap.is_advertising = m_advertising;
    snap.in_background = m_in_background;
    snap.disconnect_in_background = m_disconnect_in_background;

    {
        std::lock_guard<std::mutex> lock(m_snapshot_mutex);
        m_snapshot = snap;
    }

    StateObserver observer;
    {
        std::lock_guard<std::mutex> lock(m_observer_mutex);
        observer = m_state_observer;
    }
    if (observer) observer(snap);
}

void SessionManager::Impl::handleControl(const ControlEvent& command) {
    std::visit([this](auto&& cmd) {
        using T = std::decay_t<decltype(cmd)>;
        if constexpr (std::is_same_v<T, SetBrowsingCommand>) {
            setBrowsing(cmd.enable);
        } else if constexpr (std::is_same_v<T, SetAdvertisingCommand>) {
            setAdvertising(cmd.enable);
        } else if constexpr (std::is_same_v<T, TogglePeerSelectionCommand>) {
            togglePeerSelection(cmd.peer_id);
        } else if constexpr (std::is_same_v<T, SendDataCommand>) {
            m_message_handler.handleSend(cmd.data);
        } else if constexpr (std::is_same_v<T, DisconnectPeerCommand>) {
            m_peer_lifecycle.handleDisconnectPeer(cmd.peer_id);
        } else if constexpr (std::is_same_v<T, DisconnectSessionCommand>) {
            disconnectSessionInternal("requested");
        } else if constexpr (std::is_same_v<T, ClearLogsCommand>) {
            m_journal.clear();
        } else if constexpr (std::is_same_v<T, SetDisconnectInBackgroundCommand>) {
            m_disconnect_in_background = cmd.enabled;
            m_journal.info(std::string("Disconnect in background ") + (cmd.enabled ? "enabled" : "disabled"));
        }
    }, command);
}

PeerContext& SessionManager::Impl::context(const PeerId& peer) {
    auto it = m_contexts.find(peer.id);
    if (it == m_contexts.end()) {
        it = m_contexts.emplace(peer.id, PeerContext(peer)).first;
    } else if (!peer.display_name.empty()) {
        it->second.peer.display_name = peer.display_name;
    }
    return it->second;
}

PeerContext* SessionManager::Impl::findContext(const std::string& peer_id) {
    auto it = m_contexts.find(peer_id);
    return it == m_contexts.end() ? nullptr : &it->second;
}

void SessionManager::Impl::pruneContext(const std::string& peer_id) {
    auto it = m_contexts.find(peer_id);
    if (it == m_contexts.end()) return;
    const PeerContext& ctx = it->second;
    if (ctx.state == PeerState::NOT_PRESENT && !ctx.invite_pending &&
        !m_timers.isArmed(TimerKind::BACKUP_INVITE, peer_id)) {
        m_contexts.erase(it);
    }
}

bool SessionManager::Impl::isSessionMember(const PeerId& peer) const {
    const auto members = m_session->connectedPeers();
    return std::find(members.begin(), members.end(), peer) != members.end();
}

bool SessionManager::Impl::invitePeer(PeerContext& ctx, int timeout_sec, const std::string& reason) {
    if (!m_browser || !m_browsing) {
        m_journal.warn("Cannot invite " + ctx.peer.label() + ": browsing is not active");
        return false;
    }
    ctx.invite_pending = true;
    ctx.last_invite_at = std::chrono::steady_clock::now();
    ctx.last_invite_timeout_sec = timeout_sec;

    m_journal.info("Inviting " + ctx.peer.label() + " (" + reason + ", timeout " + std::to_string(timeout_sec) + "s)");
    m_browser->invitePeer(ctx.peer, *m_session, Bytes(), timeout_sec);
    return true;
}

void SessionManager::Impl::armTimer(TimerKind kind, const std::string& key, std::chrono::milliseconds delay,
                                    TimerTable::Callback callback) {
    m_timers.arm(kind, key, delay, [this, cb = std::move(callback)]() {
        cb();
        publishSnapshot();
    });
}

bool SessionManager::Impl::createBrowser() {
    // The previous instance cannot be restarted after a stop
    m_browser.reset();
    const uint64_t generation = ++m_browser_generation;

    m_browser = m_factory->createBrowser(m_identity, m_settings.service_type);
    if (!m_browser) {
        m_journal.error("Transport factory returned no browser");
        return false;
    }
    m_browser->setCallbacks(
        [this, generation](const PeerId& peer, const DiscoveryInfo& info) {
            m_discovery_funnel.push(PeerFoundEvent{peer, info, generation});
        },
        [this, generation](const PeerId& peer) {
            m_discovery_funnel.push(PeerLostEvent{peer, generation});
        },
        [this, generation](const std::string& error) {
            m_discovery_funnel.push(BrowsingFailedEvent{error, generation});
        });
    return true;
}

bool SessionManager::Impl::createAdvertiser() {
    m_advertiser.reset();
    const uint64_t generation = ++m_advertiser_generation;

    DiscoveryInfo info = m_settings.discovery_info;
    if (!m_identity.displayName().empty()) {
        info.emplace("display_name", m_identity.displayName());
    }
    m_advertiser = m_factory->createAdvertiser(m_identity, m_settings.service_type, info);
    if (!m_advertiser) {
        m_journal.error("Transport factory returned no advertiser");
        return false;
    }
    m_advertiser->setCallbacks(
        [this, generation](const PeerId& from, const Bytes& context, InvitationHandler handler) {
            m_advertising_funnel.push(InvitationReceivedEvent{from, context, std::move(handler), generation});
        },
        [this, generation](const std::string& error) {
            m_advertising_funnel.push(AdvertisingFailedEvent{error, generation});
        });
    return true;
}

bool SessionManager::Impl::startBrowsingService() {
    if (m_browsing) {
        m_journal.warn("Browsing already active; start ignored");
        return false;
    }
    if (!createBrowser()) {
        return false;
    }
    m_browsing = true;
    m_browser->startBrowsing();
    m_journal.info("Browsing for '" + m_settings.service_type + "'");
    return true;
}

void SessionManager::Impl::stopBrowsingService() {
    if (!m_browsing) {
        return;
    }
    m_browsing = false;
    if (m_browser) {
        m_browser->stopBrowsing();
    }
    // Found/lost are no longer tracked once the browser is down
    resetVisibility();
    m_journal.info("Browsing stopped");
}

bool SessionManager::Impl::startAdvertisingService() {
    if (m_advertising) {
        m_journal.warn("Advertising already active; start ignored");
        return false;
    }
    if (!createAdvertiser()) {
        return false;
    }
    m_advertising = true;
    m_advertiser->startAdvertising();
    m_journal.info("Advertising as " + m_identity.peer().label());
    return true;
}

void SessionManager::Impl::stopAdvertisingService() {
    if (!m_advertising) {
        return;
    }
    m_advertising = false;
    if (m_advertiser) {
        m_advertiser->stopAdvertising();
    }
    m_journal.info("Advertising stopped");
}

void SessionManager::Impl::setBrowsing(std::optional<bool> enable) {
    if (m_in_background) {
        // Applied when the foreground restart recreates the services
        m_resume_browsing = enable.value_or(!m_resume_browsing);
        m_journal.info(std::string("Browsing will ") + (m_resume_browsing ? "resume" : "stay off") + " on foreground");
        return;
    }
    const bool target = enable.value_or(!m_browsing);
    if (target) {
        startBrowsingService();
    } else {
        stopBrowsingService();
    }
}

void SessionManager::Impl::setAdvertising(std::optional<bool> enable) {
    if (m_in_background) {
        m_resume_advertising = enable.value_or(!m_resume_advertising);
        m_journal.info(std::string("Advertising will ") + (m_resume_advertising ? "resume" : "stay off") + " on foreground");
        return;
    }
    const bool target = enable.value_or(!m_advertising);
    if (target) {
        startAdvertisingService();
    } else {
        stopAdvertisingService();
    }
}

void SessionManager::Impl::recreateServices(bool browse, bool advertise) {
    stopBrowsingService();
    stopAdvertisingService();
    m_browser.reset();
    m_advertiser.reset();

    if (browse) startBrowsingService();
    if (advertise) startAdvertisingService();
}

void SessionManager::Impl::resetVisibility() {
    std::vector<std::string> gone;
    for (auto& entry : m_contexts) {
        PeerContext& ctx = entry.second;
        if (ctx.visible) {
            m_fsm.handle_event(ctx, PeerEvent::LOST);
        }
        if (ctx.state == PeerState::NOT_PRESENT) {
            gone.push_back(entry.first);
        }
    }
    for (const auto& id : gone) {
        pruneContext(id);
    }
}

void SessionManager::Impl::togglePeerSelection(const std::string& peer_id) {
    auto selected = m_registry.toggleSelection(peer_id);
    if (!selected) {
        m_journal.warn("Cannot toggle selection: unknown peer " + peer_id);
        return;
    }
    const RemotePeer* entry = m_registry.find(peer_id);
    m_journal.info((*selected ? "Selected " : "Deselected ") + entry->peer.label());
}

void SessionManager::Impl::disconnectSessionInternal(const std::string& reason) {
    m_session->disconnect();
    m_registry.clear();
    m_registry.clearAllFirstSeen();
    m_policy.resetAll();
    const size_t cancelled = m_timers.cancelKind(TimerKind::BACKUP_INVITE);

    std::vector<std::string> gone;
    for (auto& entry : m_contexts) {
        m_fsm.handle_event(entry.second, PeerEvent::SESSION_RESET);
        if (entry.second.state == PeerState::NOT_PRESENT) {
            gone.push_back(entry.first);
        }
    }
    for (const auto& id : gone) {
        pruneContext(id);
    }

    m_journal.info("Session disconnected (" + reason + ")" +
                   (cancelled > 0 ? ", " + std::to_string(cancelled) + " backup invite(s) cancelled" : ""));
}

// =======================================================
// Public API
// =======================================================
SessionManager::SessionManager(LocalIdentity identity,
                               std::shared_ptr<IMeshTransportFactory> factory,
                               std::shared_ptr<ILifecycleNotifier> lifecycle,
                               SessionSettings settings)
    : m_impl(std::make_unique<Impl>(std::move(identity), std::move(factory),
                                    std::move(lifecycle), std::move(settings))) {}

SessionManager::~SessionManager() = default;

bool SessionManager::start(std::string* error) {
    return m_impl->start(error);
}

void SessionManager::stop() {
    m_impl->stop();
}

bool SessionManager::isRunning() const {
    return m_impl->isRunning();
}

void SessionManager::startBroadcasting() {
    m_impl->submit(SetBrowsingCommand{true}, "start browsing");
    m_impl->submit(SetAdvertisingCommand{true}, "start advertising");
}

void SessionManager::stopBroadcasting() {
    m_impl->submit(SetBrowsingCommand{false}, "stop browsing");
    m_impl->submit(SetAdvertisingCommand{false}, "stop advertising");
}

void SessionManager::setBrowsing(bool enabled) {
    m_impl->submit(SetBrowsingCommand{enabled}, "set browsing");
}

void SessionManager::toggleBrowsing() {
    m_impl->submit(SetBrowsingCommand{std::nullopt}, "toggle browsing");
}

void SessionManager::setAdvertising(bool enabled) {
    m_impl->submit(SetAdvertisingCommand{enabled}, "set advertising");
}

void SessionManager::toggleAdvertising() {
    m_impl->submit(SetAdvertisingCommand{std::nullopt}, "toggle advertising");
}

void SessionManager::togglePeerSelection(const std::string& peer_id) {
    m_impl->submit(TogglePeerSelectionCommand{peer_id}, "toggle selection");
}

void SessionManager::sendData(Bytes data) {
    m_impl->submit(SendDataCommand{std::move(data)}, "send");
}

void SessionManager::sendTestPayload() {
    sendData(Bytes(std::begin(TEST_PAYLOAD), std::end(TEST_PAYLOAD)));
}

void SessionManager::disconnectPeer(const std::string& peer_id) {
    m_impl->submit(DisconnectPeerCommand{peer_id}, "disconnect peer");
}

void SessionManager::disconnectSession() {
    m_impl->submit(DisconnectSessionCommand{}, "disconnect session");
}

void SessionManager::clearLogs() {
    if (!m_impl->isRunning()) {
        m_impl->m_journal.clear();
        return;
    }
    m_impl->submit(ClearLogsCommand{}, "clear logs");
}

void SessionManager::setDisconnectInBackground(bool enabled) {
    m_impl->submit(SetDisconnectInBackgroundCommand{enabled}, "disconnect in background");
}

MeshSnapshot SessionManager::snapshot() const {
    return m_impl->snapshot();
}

std::vector<LogEntry> SessionManager::logs() const {
    return m_impl->m_journal.entries();
}

std::string SessionManager::reconnectStatusJson() const {
    return m_impl->m_policy.get_status_json();
}

void SessionManager::setStateObserver(StateObserver observer) {
    m_impl->setStateObserver(std::move(observer));
}

void SessionManager::setLogObserver(std::function<void()> observer) {
    m_impl->m_journal.setObserver(std::move(observer));
}

const LocalIdentity& SessionManager::localIdentity() const {
    return m_impl->m_identity;
}

const SessionSettings& SessionManager::settings() const {
    return m_impl->m_settings;
}
