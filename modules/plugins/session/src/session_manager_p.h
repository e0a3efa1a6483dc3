#pragma once

#include "session_manager.h"
#include "session_dependencies.h"
#include "lifecycle_notifier.h"
#include "session_events.h"
#include "event_manager.h"
#include "event_funnel.h"
#include "peer_state_machine.h"
#include "peer_registry.h"
#include "timer_table.h"
#include "log_journal.h"
#include "constants.h"
#include "logger.h"
#include "peer_reconnect_policy.h"
#include "discovery_handler.h"
#include "advertising_handler.h"
#include "peer_lifecycle_manager.h"
#include "message_handler.h"
#include "lifecycle_coordinator.h"
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

class SessionManager::Impl {
public:
    Impl(LocalIdentity identity,
         std::shared_ptr<IMeshTransportFactory> factory,
         std::shared_ptr<ILifecycleNotifier> lifecycle,
         SessionSettings settings);
    ~Impl();

    bool start(std::string* error);
    void stop();
    bool isRunning() const { return m_running.load(std::memory_order_acquire); }

    // Thread-safe entry point for UI commands
    void submit(ControlEvent command, const char* what);

    MeshSnapshot snapshot() const;
    void setStateObserver(StateObserver observer);

private:
    friend class SessionManager;
    friend class detail::DiscoveryHandler;
    friend class detail::AdvertisingHandler;
    friend class detail::PeerLifecycleManager;
    friend class detail::MessageHandler;
    friend class detail::LifecycleCoordinator;

    // ---- Executor side (loop thread, or caller thread once the loop is stopped) ----
    void handleControl(const ControlEvent& command);
    void publishSnapshot();

    PeerContext& context(const PeerId& peer);
    PeerContext* findContext(const std::string& peer_id);
    // Drops bookkeeping for a peer that is neither visible nor in the session
    void pruneContext(const std::string& peer_id);

    bool isSessionMember(const PeerId& peer) const;
    bool invitePeer(PeerContext& ctx, int timeout_sec, const std::string& reason);
    void armTimer(TimerKind kind, const std::string& key, std::chrono::milliseconds delay, TimerTable::Callback callback);

    bool createBrowser();
    bool createAdvertiser();
    bool startBrowsingService();
    void stopBrowsingService();
    bool startAdvertisingService();
    void stopAdvertisingService();
    void setBrowsing(std::optional<bool> enable);
    void setAdvertising(std::optional<bool> enable);
    // Tears both services down and starts fresh instances of the requested ones
    void recreateServices(bool browse, bool advertise);
    void resetVisibility();

    void togglePeerSelection(const std::string& peer_id);
    void disconnectSessionInternal(const std::string& reason);

    // ---- Immutable after construction ----
    const LocalIdentity m_identity;
    const SessionSettings m_settings;
    std::shared_ptr<IMeshTransportFactory> m_factory;
    std::shared_ptr<ILifecycleNotifier> m_lifecycle;

    LogJournal m_journal;
    PeerStateMachine m_fsm;
    PeerReconnectPolicy m_policy;
    EventManager m_event_manager;
    TimerTable m_timers;

    // ---- Executor-owned state ----
    PeerRegistry m_registry;
    std::unordered_map<std::string, PeerContext> m_contexts;
    bool m_browsing{false};
    bool m_advertising{false};
    bool m_in_background{false};
    bool m_disconnect_in_background{false};
    // Services to bring back on foreground
    bool m_resume_browsing{false};
    bool m_resume_advertising{false};
    uint64_t m_browser_generation{0};
    uint64_t m_advertiser_generation{0};

    // ---- Start/stop ----
    std::mutex m_start_stop_mutex;
    std::atomic<bool> m_running{false};
    int m_lifecycle_token{0};

    // ---- Published state ----
    mutable std::mutex m_snapshot_mutex;
    MeshSnapshot m_snapshot;
    std::mutex m_observer_mutex;
    StateObserver m_state_observer;

    // ---- Handlers ----
    detail::DiscoveryHandler m_discovery_handler;
    detail::AdvertisingHandler m_advertising_handler;
    detail::PeerLifecycleManager m_peer_lifecycle;
    detail::MessageHandler m_message_handler;
    detail::LifecycleCoordinator m_lifecycle_coordinator;

    // ---- Funnels, all drained by the one executor ----
    EventFunnel<DiscoveryEvent> m_discovery_funnel;
    EventFunnel<AdvertisingEvent> m_advertising_funnel;
    EventFunnel<SessionStateEvent> m_session_state_funnel;
    EventFunnel<DataReceivedEvent> m_data_funnel;
    EventFunnel<ControlEvent> m_control_funnel;
    EventFunnel<AppLifecycleEvent> m_lifecycle_funnel;

    // ---- Transport, declared last so it is destroyed before the funnels ----
    std::unique_ptr<IMeshSession> m_session;
    std::unique_ptr<IServiceBrowser> m_browser;
    std::unique_ptr<IServiceAdvertiser> m_advertiser;
};
