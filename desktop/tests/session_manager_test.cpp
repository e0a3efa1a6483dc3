#include "session_manager.h"
#include "lifecycle_notifier.h"
#include "config_manager.h"
#include "logger.h"
#include "recording_transport.h"
#include <atomic>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

static int tests_failed = 0;

#define TEST_ASSERT(cond, msg) \
    do { \
        if (!(cond)) { \
            std::cerr << "FAIL: " << msg << " [" << __FILE__ << ":" << __LINE__ << "]" << std::endl; \
            tests_failed++; \
            return false; \
        } \
    } while (0)

// "m" sits between "a" and "z": the local node invites z and waits for a
static const PeerId LOCAL("nearmesh-m", "local");
static const PeerId LOWER("nearmesh-a", "alice");
static const PeerId HIGHER("nearmesh-z", "zed");

static SessionSettings test_settings() {
    SessionSettings s;
    s.service_type = "nearmesh-test";
    s.auto_start = true;
    s.invite_timeout_sec = 10;
    s.reconnect_invite_timeout_sec = 5;
    s.backup_invite_delay = std::chrono::milliseconds(150);
    s.restart_debounce = std::chrono::milliseconds(100);
    s.max_reconnect_attempts = 0;
    s.log_journal_max_entries = 200;
    return s;
}

struct Fixture {
    std::shared_ptr<RecordingTransport> transport = std::make_shared<RecordingTransport>();
    std::shared_ptr<LifecycleNotifier> lifecycle = std::make_shared<LifecycleNotifier>();
    std::unique_ptr<SessionManager> manager;

    explicit Fixture(SessionSettings settings = test_settings()) {
        manager = std::make_unique<SessionManager>(LocalIdentity::withId(LOCAL.id, LOCAL.display_name),
                                                   transport, lifecycle, settings);
    }

    ~Fixture() { manager->stop(); }

    bool startAndWait() {
        if (!manager->start()) return false;
        return wait_until([this] {
            const MeshSnapshot s = manager->snapshot();
            return s.is_browsing && s.is_advertising;
        });
    }

    bool hasLog(const std::string& needle) const {
        for (const auto& entry : manager->logs()) {
            if (entry.message.find(needle) != std::string::npos) return true;
        }
        return false;
    }

    const RemotePeer* peer(const MeshSnapshot& s, const std::string& id) const {
        for (const auto& p : s.peers) {
            if (p.peer.id == id) return &p;
        }
        return nullptr;
    }

    bool isConnected(const std::string& id) const {
        const MeshSnapshot s = manager->snapshot();
        const RemotePeer* p = peer(s, id);
        return p && p->is_connected;
    }

    // Discovered and connected, through the regular path
    bool connect(const PeerId& remote) {
        transport->found(remote);
        transport->sessionState(remote, SessionState::CONNECTING);
        transport->sessionState(remote, SessionState::CONNECTED);
        return wait_until([&] { return isConnected(remote.id); });
    }
};

bool test_start_stop_idempotent() {
    std::cout << "Testing start/stop idempotence..." << std::endl;
    Fixture f;

    TEST_ASSERT(f.startAndWait(), "start should bring up browsing and advertising");
    TEST_ASSERT(f.transport->browsing(), "transport browser should be started");
    TEST_ASSERT(f.transport->advertising(), "transport advertiser should be started");

    std::string error;
    TEST_ASSERT(!f.manager->start(&error), "second start should be rejected");
    TEST_ASSERT(error == "already running", "second start should explain why");
    TEST_ASSERT(f.transport->browserCount() == 1, "second start must not create another browser");

    f.manager->stop();
    f.manager->stop();
    TEST_ASSERT(!f.manager->isRunning(), "manager should be stopped");
    TEST_ASSERT(!f.manager->snapshot().is_running, "snapshot should report stopped");
    TEST_ASSERT(!f.transport->browsing(), "browser should be stopped");
    TEST_ASSERT(!f.transport->advertising(), "advertiser should be stopped");

    f.manager->setBrowsing(true);
    TEST_ASSERT(f.hasLog("ignored: not running"), "commands after stop are dropped and logged");

    // A stopped manager can be started again with fresh services
    TEST_ASSERT(f.startAndWait(), "restart after stop");
    TEST_ASSERT(f.transport->browserCount() == 2, "restart should create a fresh browser");

    std::cout << "Start/stop idempotence Passed!" << std::endl;
    return true;
}

bool test_tie_break_lower_id_invites() {
    std::cout << "Testing invitation tie-break..." << std::endl;
    Fixture f;
    TEST_ASSERT(f.startAndWait(), "start");

    f.transport->found(HIGHER);
    TEST_ASSERT(wait_until([&] { return f.transport->invitesTo(HIGHER.id) == 1; }), "lower local id should invite");
    TEST_ASSERT(f.transport->lastInvite().timeout_sec == 10, "discovery invite uses the regular timeout");

    f.transport->found(LOWER);
    settle();
    TEST_ASSERT(f.transport->invitesTo(LOWER.id) == 0, "higher local id must wait to be invited");
    TEST_ASSERT(f.hasLog("Waiting for"), "waiting should be logged");

    std::cout << "Invitation tie-break Passed!" << std::endl;
    return true;
}

bool test_duplicate_found_and_self_discovery() {
    std::cout << "Testing duplicate and self discovery..." << std::endl;
    Fixture f;
    TEST_ASSERT(f.startAndWait(), "start");

    f.transport->found(LOCAL);
    f.transport->found(HIGHER);
    f.transport->found(HIGHER);
    settle();
    TEST_ASSERT(f.transport->invitesTo(LOCAL.id) == 0, "self discovery must be ignored");
    TEST_ASSERT(f.transport->invitesTo(HIGHER.id) == 1, "outstanding invitation must not be repeated");

    std::cout << "Duplicate and self discovery Passed!" << std::endl;
    return true;
}

bool test_found_session_member_not_invited() {
    std::cout << "Testing discovery of an existing session member..." << std::endl;
    Fixture f;
    TEST_ASSERT(f.startAndWait(), "start");

    // Joined through the advertiser; discovery arrives afterwards
    f.transport->sessionState(HIGHER, SessionState::CONNECTED);
    TEST_ASSERT(wait_until([&] { return f.isConnected(HIGHER.id); }), "peer should be connected");
    f.transport->found(HIGHER);
    settle();
    TEST_ASSERT(f.transport->invitesTo(HIGHER.id) == 0, "session members are not invited again");

    std::cout << "Discovery of session member Passed!" << std::endl;
    return true;
}

bool test_invitation_always_accepted() {
    std::cout << "Testing invitation acceptance..." << std::endl;
    Fixture f;
    TEST_ASSERT(f.startAndWait(), "start");

    f.transport->invitation(LOWER);
    f.transport->invitation(HIGHER);
    TEST_ASSERT(wait_until([&] { return f.transport->answers().size() == 2; }), "both invitations answered");
    for (const auto& answer : f.transport->answers()) {
        TEST_ASSERT(answer.accept, "invitation must be accepted");
        TEST_ASSERT(answer.with_session, "accepting hands over the local session");
    }

    std::cout << "Invitation acceptance Passed!" << std::endl;
    return true;
}

bool test_connecting_then_connected() {
    std::cout << "Testing registry updates from session state..." << std::endl;
    Fixture f;
    TEST_ASSERT(f.startAndWait(), "start");

    f.transport->found(HIGHER);
    f.transport->sessionState(HIGHER, SessionState::CONNECTING);
    TEST_ASSERT(wait_until([&] { return f.manager->snapshot().peers.size() == 1; }), "connecting peer is registered");
    {
        const MeshSnapshot s = f.manager->snapshot();
        const RemotePeer* p = f.peer(s, HIGHER.id);
        TEST_ASSERT(p && !p->is_connected && !p->is_selected, "connecting peer is neither connected nor selected");
        TEST_ASSERT(p->discovered_at.has_value(), "first-seen time is attached");
    }

    f.transport->sessionState(HIGHER, SessionState::CONNECTED);
    TEST_ASSERT(wait_until([&] { return f.isConnected(HIGHER.id); }), "peer becomes connected");
    {
        const MeshSnapshot s = f.manager->snapshot();
        const RemotePeer* p = f.peer(s, HIGHER.id);
        TEST_ASSERT(p && p->is_selected, "connected peer is selected by default");
    }
    TEST_ASSERT(f.hasLog("Connected to zed (nearmesh-z) after"), "connection time is logged");

    // A second CONNECTED keeps exactly one entry
    f.transport->sessionState(HIGHER, SessionState::CONNECTED);
    settle();
    TEST_ASSERT(f.manager->snapshot().peers.size() == 1, "no duplicate registry entries");

    // Unknown state is logged and otherwise ignored
    f.transport->sessionState(HIGHER, SessionState::UNKNOWN);
    settle();
    TEST_ASSERT(f.isConnected(HIGHER.id), "unknown state must not change the registry");
    TEST_ASSERT(f.hasLog("Unknown session state"), "unknown state is logged");

    std::cout << "Registry updates Passed!" << std::endl;
    return true;
}

bool test_lost_peer_keeps_session() {
    std::cout << "Testing discovery loss of a connected peer..." << std::endl;
    Fixture f;
    TEST_ASSERT(f.startAndWait(), "start");
    TEST_ASSERT(f.connect(HIGHER), "connect");

    f.transport->lost(HIGHER);
    settle();
    TEST_ASSERT(f.isConnected(HIGHER.id), "losing discovery must not drop a session member");
    TEST_ASSERT(f.hasLog("session still active"), "loss of a member is logged as such");

    // Session loss while not visible: removed, no reconnection
    const size_t invites = f.transport->inviteCount();
    f.transport->sessionState(HIGHER, SessionState::NOT_CONNECTED);
    TEST_ASSERT(wait_until([&] { return f.manager->snapshot().peers.empty(); }), "peer removed on disconnect");
    settle();
    TEST_ASSERT(f.transport->inviteCount() == invites, "invisible peers are not reconnected");

    std::cout << "Discovery loss of connected peer Passed!" << std::endl;
    return true;
}

bool test_reconnect_initiator_invites_immediately() {
    std::cout << "Testing reconnect as initiator..." << std::endl;
    Fixture f;
    TEST_ASSERT(f.startAndWait(), "start");
    TEST_ASSERT(f.connect(HIGHER), "connect");
    TEST_ASSERT(f.transport->invitesTo(HIGHER.id) == 1, "initial discovery invite");

    f.transport->sessionState(HIGHER, SessionState::NOT_CONNECTED);
    TEST_ASSERT(wait_until([&] { return f.transport->invitesTo(HIGHER.id) == 2; }), "initiator re-invites at once");
    TEST_ASSERT(f.transport->lastInvite().timeout_sec == 5, "reconnect invite uses the short timeout");
    TEST_ASSERT(wait_until([&] { return f.manager->snapshot().peers.empty(); }), "lost peer leaves the registry");
    TEST_ASSERT(f.hasLog("Disconnected from zed"), "disconnect is logged");

    std::cout << "Reconnect as initiator Passed!" << std::endl;
    return true;
}

bool test_reconnect_backup_invite_fires() {
    std::cout << "Testing backup invite..." << std::endl;
    Fixture f;
    TEST_ASSERT(f.startAndWait(), "start");
    TEST_ASSERT(f.connect(LOWER), "connect");
    TEST_ASSERT(f.transport->invitesTo(LOWER.id) == 0, "non-initiator never invites on discovery");

    f.transport->sessionState(LOWER, SessionState::NOT_CONNECTED);
    settle(std::chrono::milliseconds(50));
    TEST_ASSERT(f.transport->invitesTo(LOWER.id) == 0, "non-initiator waits before inviting");

    TEST_ASSERT(wait_until([&] { return f.transport->invitesTo(LOWER.id) == 1; }), "backup invite fires");
    TEST_ASSERT(f.transport->lastInvite().timeout_sec == 5, "backup invite uses the reconnect timeout");
    TEST_ASSERT(f.hasLog("backup invite"), "backup invite is logged");

    std::cout << "Backup invite Passed!" << std::endl;
    return true;
}

bool test_backup_invite_superseded_by_invitation() {
    std::cout << "Testing backup invite superseded by incoming invitation..." << std::endl;
    Fixture f;
    TEST_ASSERT(f.startAndWait(), "start");
    TEST_ASSERT(f.connect(LOWER), "connect");

    f.transport->sessionState(LOWER, SessionState::NOT_CONNECTED);
    TEST_ASSERT(wait_until([&] { return f.hasLog("Waiting for alice (nearmesh-a) to reconnect"); }), "backup invite armed");
    f.transport->invitation(LOWER);
    TEST_ASSERT(wait_until([&] { return f.transport->answers().size() == 1; }), "invitation answered");

    settle(std::chrono::milliseconds(300));
    TEST_ASSERT(f.transport->invitesTo(LOWER.id) == 0, "superseded backup invite must not fire");
    TEST_ASSERT(f.hasLog("superseded"), "supersession is logged");

    std::cout << "Backup invite supersession Passed!" << std::endl;
    return true;
}

bool test_backup_invite_skipped_after_loss() {
    std::cout << "Testing backup invite after discovery loss..." << std::endl;
    Fixture f;
    TEST_ASSERT(f.startAndWait(), "start");
    TEST_ASSERT(f.connect(LOWER), "connect");

    f.transport->sessionState(LOWER, SessionState::NOT_CONNECTED);
    TEST_ASSERT(wait_until([&] { return f.hasLog("Waiting for alice (nearmesh-a) to reconnect"); }), "backup invite armed");
    f.transport->lost(LOWER);
    TEST_ASSERT(wait_until([&] { return f.hasLog("no longer discovered"); }), "timer re-checks visibility");
    TEST_ASSERT(f.transport->invitesTo(LOWER.id) == 0, "no invite to a vanished peer");

    std::cout << "Backup invite after loss Passed!" << std::endl;
    return true;
}

bool test_disconnect_peer_is_expected() {
    std::cout << "Testing explicit peer disconnect..." << std::endl;
    Fixture f;
    TEST_ASSERT(f.startAndWait(), "start");
    TEST_ASSERT(f.connect(HIGHER), "connect");

    f.manager->disconnectPeer(HIGHER.id);
    TEST_ASSERT(wait_until([&] { return f.transport->cancelledCount(HIGHER.id) == 1; }), "transport asked to drop peer");

    f.transport->sessionState(HIGHER, SessionState::NOT_CONNECTED);
    TEST_ASSERT(wait_until([&] { return f.manager->snapshot().peers.empty(); }), "peer removed");
    settle();
    TEST_ASSERT(f.transport->invitesTo(HIGHER.id) == 1, "expected loss must not trigger reconnection");

    f.manager->disconnectPeer("nearmesh-unknown");
    TEST_ASSERT(wait_until([&] { return f.hasLog("is not connected"); }), "unknown peer disconnect is logged");

    std::cout << "Explicit peer disconnect Passed!" << std::endl;
    return true;
}

bool test_send_and_ack() {
    std::cout << "Testing send to selected peers and ACK..." << std::endl;
    Fixture f;
    TEST_ASSERT(f.startAndWait(), "start");
    TEST_ASSERT(f.connect(HIGHER), "connect");

    f.manager->sendTestPayload();
    TEST_ASSERT(wait_until([&] { return f.transport->sentCount() == 1; }), "payload sent");
    {
        const RecordedSend sent = f.transport->lastSent();
        TEST_ASSERT((sent.data == Bytes{1, 2, 3, 4, 5}), "test payload bytes");
        TEST_ASSERT(sent.peers.size() == 1 && sent.peers[0] == HIGHER, "sent to the selected peer only");
    }

    f.transport->data(Bytes{9, 9}, HIGHER);
    TEST_ASSERT(wait_until([&] { return f.transport->sentCount() == 2; }), "ACK sent back");
    {
        const RecordedSend ack = f.transport->lastSent();
        TEST_ASSERT((ack.data == Bytes{'A', 'C', 'K'}), "ACK marker");
        TEST_ASSERT(ack.peers.size() == 1 && ack.peers[0] == HIGHER, "ACK goes to the sender only");
    }

    f.transport->data(Bytes{'A', 'C', 'K'}, HIGHER);
    TEST_ASSERT(wait_until([&] { return f.hasLog("ACK received from zed"); }), "ACK receipt logged");
    settle();
    TEST_ASSERT(f.transport->sentCount() == 2, "an ACK is never acknowledged");

    f.transport->setFailSends(true);
    f.manager->sendTestPayload();
    TEST_ASSERT(wait_until([&] { return f.hasLog("simulated send failure"); }), "send errors are logged");

    std::cout << "Send and ACK Passed!" << std::endl;
    return true;
}

bool test_send_without_selection() {
    std::cout << "Testing send with nothing selected..." << std::endl;
    Fixture f;
    TEST_ASSERT(f.startAndWait(), "start");
    TEST_ASSERT(f.connect(HIGHER), "connect");

    f.manager->togglePeerSelection(HIGHER.id);
    TEST_ASSERT(wait_until([&] {
        const MeshSnapshot s = f.manager->snapshot();
        const RemotePeer* p = f.peer(s, HIGHER.id);
        return p && !p->is_selected;
    }), "selection toggled off");

    f.manager->sendTestPayload();
    TEST_ASSERT(wait_until([&] { return f.hasLog("No peers selected"); }), "empty selection is logged");
    TEST_ASSERT(f.transport->sentCount() == 0, "nothing is sent");

    f.manager->togglePeerSelection("nearmesh-unknown");
    TEST_ASSERT(wait_until([&] { return f.hasLog("unknown peer"); }), "unknown selection is logged");

    std::cout << "Send with nothing selected Passed!" << std::endl;
    return true;
}

bool test_disconnect_session() {
    std::cout << "Testing session disconnect..." << std::endl;
    Fixture f;
    TEST_ASSERT(f.startAndWait(), "start");
    TEST_ASSERT(f.connect(HIGHER), "connect");
    TEST_ASSERT(f.connect(LOWER), "connect second peer");

    f.manager->disconnectSession();
    TEST_ASSERT(wait_until([&] { return f.manager->snapshot().peers.empty(); }), "registry cleared");
    TEST_ASSERT(f.transport->disconnects() == 1, "transport session disconnected");
    TEST_ASSERT(f.manager->snapshot().is_browsing, "services keep running");

    std::cout << "Session disconnect Passed!" << std::endl;
    return true;
}

bool test_background_then_foreground() {
    std::cout << "Testing background/foreground cycle..." << std::endl;
    Fixture f;
    TEST_ASSERT(f.startAndWait(), "start");
    TEST_ASSERT(f.connect(HIGHER), "connect");

    f.lifecycle->post(AppTransition::ENTERED_BACKGROUND);
    TEST_ASSERT(wait_until([&] { return f.manager->snapshot().in_background; }), "background recorded");
    {
        const MeshSnapshot s = f.manager->snapshot();
        TEST_ASSERT(!s.is_browsing && !s.is_advertising, "services stopped in background");
        TEST_ASSERT(s.peers.size() == 1, "session survives background by default");
    }
    TEST_ASSERT(!f.transport->browsing() && !f.transport->advertising(), "transport services stopped");
    TEST_ASSERT(f.transport->disconnects() == 0, "no disconnect by default");

    f.lifecycle->post(AppTransition::ENTERED_FOREGROUND);
    TEST_ASSERT(wait_until([&] {
        const MeshSnapshot s = f.manager->snapshot();
        return s.is_browsing && s.is_advertising && !s.in_background;
    }), "services restart after the debounce");
    TEST_ASSERT(f.transport->browserCount() == 2, "a fresh browser is created");
    TEST_ASSERT(f.transport->advertiserCount() == 2, "a fresh advertiser is created");
    TEST_ASSERT(f.transport->browsing(), "new browser running");

    std::cout << "Background/foreground cycle Passed!" << std::endl;
    return true;
}

bool test_rapid_lifecycle_toggle() {
    std::cout << "Testing rapid background/foreground toggling..." << std::endl;
    Fixture f;
    TEST_ASSERT(f.startAndWait(), "start");

    f.lifecycle->post(AppTransition::ENTERED_BACKGROUND);
    f.lifecycle->post(AppTransition::ENTERED_FOREGROUND);
    f.lifecycle->post(AppTransition::ENTERED_BACKGROUND);
    settle(std::chrono::milliseconds(300));

    const MeshSnapshot s = f.manager->snapshot();
    TEST_ASSERT(s.in_background, "last transition wins");
    TEST_ASSERT(!s.is_browsing && !s.is_advertising, "cancelled restart must not bring services back");
    TEST_ASSERT(f.transport->browserCount() == 1, "no browser created while in background");

    // Commands in background only change what comes back on foreground
    f.manager->setAdvertising(false);
    settle();
    f.lifecycle->post(AppTransition::ENTERED_FOREGROUND);
    TEST_ASSERT(wait_until([&] { return f.manager->snapshot().is_browsing; }), "browsing resumes");
    settle(std::chrono::milliseconds(150));
    TEST_ASSERT(!f.manager->snapshot().is_advertising, "advertising stays off as requested");

    std::cout << "Rapid lifecycle toggling Passed!" << std::endl;
    return true;
}

bool test_disconnect_in_background() {
    std::cout << "Testing disconnect in background..." << std::endl;
    Fixture f;
    TEST_ASSERT(f.startAndWait(), "start");
    TEST_ASSERT(f.connect(LOWER), "connect");

    // Pending backup invite must not survive background either
    f.transport->sessionState(LOWER, SessionState::NOT_CONNECTED);
    TEST_ASSERT(wait_until([&] { return f.hasLog("Waiting for alice (nearmesh-a) to reconnect"); }), "backup invite armed");
    f.manager->setDisconnectInBackground(true);
    TEST_ASSERT(wait_until([&] { return f.manager->snapshot().disconnect_in_background; }), "setting applied");

    f.lifecycle->post(AppTransition::ENTERED_BACKGROUND);
    TEST_ASSERT(wait_until([&] { return f.transport->disconnects() == 1; }), "session left on background");
    settle(std::chrono::milliseconds(300));
    TEST_ASSERT(f.manager->snapshot().peers.empty(), "registry cleared");
    TEST_ASSERT(f.transport->invitesTo(LOWER.id) == 0, "backup invite cancelled by background");

    std::cout << "Disconnect in background Passed!" << std::endl;
    return true;
}

bool test_stale_browser_events_ignored() {
    std::cout << "Testing events from a retired browser..." << std::endl;
    Fixture f;
    TEST_ASSERT(f.startAndWait(), "start");

    f.manager->setBrowsing(false);
    TEST_ASSERT(wait_until([&] { return !f.manager->snapshot().is_browsing; }), "browsing off");
    f.manager->setBrowsing(true);
    TEST_ASSERT(wait_until([&] { return f.transport->browserCount() == 2 && f.manager->snapshot().is_browsing; }),
                "browsing restarted with a new instance");

    f.transport->found(HIGHER, 0);
    settle();
    TEST_ASSERT(f.transport->inviteCount() == 0, "retired browser events are dropped");

    f.transport->found(HIGHER, 1);
    TEST_ASSERT(wait_until([&] { return f.transport->invitesTo(HIGHER.id) == 1; }), "current browser events count");
    TEST_ASSERT(f.transport->lastInvite().browser == 1, "invite goes through the current browser");

    std::cout << "Retired browser events Passed!" << std::endl;
    return true;
}

bool test_service_failures() {
    std::cout << "Testing browsing failure..." << std::endl;
    Fixture f;
    TEST_ASSERT(f.startAndWait(), "start");

    f.transport->browsingFailed("radio off");
    TEST_ASSERT(wait_until([&] { return !f.manager->snapshot().is_browsing; }), "browsing flag cleared");
    TEST_ASSERT(f.hasLog("radio off"), "failure is logged");
    TEST_ASSERT(f.manager->snapshot().is_advertising, "advertising unaffected");

    f.manager->toggleBrowsing();
    TEST_ASSERT(wait_until([&] { return f.manager->snapshot().is_browsing; }), "browsing can be started again");

    std::cout << "Browsing failure Passed!" << std::endl;
    return true;
}

bool test_reconnect_attempt_cap() {
    std::cout << "Testing reconnect attempt cap..." << std::endl;
    SessionSettings settings = test_settings();
    settings.max_reconnect_attempts = 1;
    Fixture f(settings);
    TEST_ASSERT(f.startAndWait(), "start");
    TEST_ASSERT(f.connect(HIGHER), "connect");

    f.transport->sessionState(HIGHER, SessionState::NOT_CONNECTED);
    TEST_ASSERT(wait_until([&] { return f.transport->invitesTo(HIGHER.id) == 2; }), "first reconnect attempt");

    // Reaches connecting but fails again before connecting fully
    f.transport->sessionState(HIGHER, SessionState::CONNECTING);
    f.transport->sessionState(HIGHER, SessionState::NOT_CONNECTED);
    TEST_ASSERT(wait_until([&] { return f.hasLog("exhausted"); }), "cap reached is logged");
    TEST_ASSERT(f.transport->invitesTo(HIGHER.id) == 2, "no invite past the cap");

    std::cout << "Reconnect attempt cap Passed!" << std::endl;
    return true;
}

bool test_settings_from_config() {
    std::cout << "Testing settings from configuration..." << std::endl;
    ConfigManager& config = ConfigManager::getInstance();
    config.reset();
    config.setValueAtPath({"service", "type"}, "nearmesh-config");
    config.setValueAtPath({"reconnect", "backup_invite_delay_ms"}, 250);
    config.setValueAtPath({"session", "invite_timeout_sec"}, -3);
    config.setValueAtPath({"lifecycle", "disconnect_in_background"}, true);

    const SessionSettings s = SessionSettings::fromConfig();
    TEST_ASSERT(s.service_type == "nearmesh-config", "service type override");
    TEST_ASSERT(s.backup_invite_delay == std::chrono::milliseconds(250), "backup delay override");
    TEST_ASSERT(s.invite_timeout_sec == 1, "invalid timeout clamped");
    TEST_ASSERT(s.disconnect_in_background, "disconnect in background override");
    TEST_ASSERT(s.restart_debounce == std::chrono::milliseconds(500), "untouched values keep defaults");
    config.reset();

    SessionSettings bad = test_settings();
    bad.service_type.clear();
    bool threw = false;
    try {
        SessionManager manager(LocalIdentity::withId(LOCAL.id, ""), std::make_shared<RecordingTransport>(),
                               nullptr, bad);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    TEST_ASSERT(threw, "empty service type is rejected");

    std::cout << "Settings from configuration Passed!" << std::endl;
    return true;
}

bool test_found_display_name_from_discovery_info() {
    std::cout << "Testing display name from discovery info..." << std::endl;
    Fixture f;
    TEST_ASSERT(f.startAndWait(), "start");

    f.transport->found(PeerId(HIGHER.id), -1, DiscoveryInfo{{"display_name", "zed"}});
    TEST_ASSERT(wait_until([&] { return f.hasLog("Found peer zed (nearmesh-z)"); }),
                "advertised display name labels a nameless peer");
    TEST_ASSERT(wait_until([&] { return f.transport->invitesTo(HIGHER.id) == 1; }), "peer invited");
    TEST_ASSERT(f.transport->lastInvite().peer.display_name == "zed", "invitation carries the advertised name");

    f.transport->found(PeerId(LOWER.id, "alice"), -1, DiscoveryInfo{{"display_name", "mallory"}});
    TEST_ASSERT(wait_until([&] { return f.hasLog("Found peer alice (nearmesh-a)"); }),
                "the transport's own display name wins");

    std::cout << "Display name from discovery info Passed!" << std::endl;
    return true;
}

bool test_unknown_state_leaves_no_context() {
    std::cout << "Testing unknown session state for an unseen peer..." << std::endl;
    Fixture f;
    TEST_ASSERT(f.startAndWait(), "start");

    f.transport->sessionState(HIGHER, SessionState::UNKNOWN);
    TEST_ASSERT(wait_until([&] { return f.hasLog("Unknown session state reported for zed (nearmesh-z)"); }),
                "unknown state logged");

    // No leftover bookkeeping: a later sighting is treated as a first sighting
    f.transport->found(HIGHER);
    TEST_ASSERT(wait_until([&] { return f.transport->invitesTo(HIGHER.id) == 1; }), "peer invited normally");
    TEST_ASSERT(f.manager->snapshot().peers.empty(), "unknown state registers nobody");

    std::cout << "Unknown session state Passed!" << std::endl;
    return true;
}

bool test_unsubscribe_waits_for_running_delivery() {
    std::cout << "Testing unsubscribe during delivery..." << std::endl;
    LifecycleNotifier notifier;
    std::atomic<bool> started{false};
    std::atomic<bool> finished{false};

    const int token = notifier.subscribe([&](AppTransition) {
        started = true;
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        finished = true;
    });

    std::thread poster([&] { notifier.post(AppTransition::ENTERED_BACKGROUND); });
    TEST_ASSERT(wait_until([&] { return started.load(); }), "delivery started");
    notifier.unsubscribe(token);
    const bool finished_at_return = finished.load();
    poster.join();
    TEST_ASSERT(finished_at_return, "unsubscribe returns only after the running callback ends");
    TEST_ASSERT(notifier.subscriberCount() == 0, "subscriber removed");

    // Unsubscribing from inside the callback must not wait for itself
    int self_token = 0;
    int calls = 0;
    self_token = notifier.subscribe([&](AppTransition) {
        calls++;
        notifier.unsubscribe(self_token);
    });
    notifier.post(AppTransition::ENTERED_FOREGROUND);
    notifier.post(AppTransition::ENTERED_FOREGROUND);
    TEST_ASSERT(calls == 1, "self-unsubscribed callback runs once");
    TEST_ASSERT(notifier.subscriberCount() == 0, "self-unsubscribe removed the subscriber");

    std::cout << "Unsubscribe during delivery Passed!" << std::endl;
    return true;
}

bool test_manager_destroyed_during_lifecycle_post() {
    std::cout << "Testing manager teardown during a lifecycle post..." << std::endl;
    auto notifier = std::make_shared<LifecycleNotifier>();
    auto transport = std::make_shared<RecordingTransport>();
    std::atomic<bool> slow_done{false};

    // Subscribed first, so it runs before the manager's callback
    notifier->subscribe([&](AppTransition) {
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        slow_done = true;
    });

    auto manager = std::make_unique<SessionManager>(LocalIdentity::withId(LOCAL.id, LOCAL.display_name),
                                                    transport, notifier, test_settings());
    TEST_ASSERT(manager->start(), "start");
    TEST_ASSERT(notifier->subscriberCount() == 2, "manager subscribed");

    std::thread poster([&] { notifier->post(AppTransition::ENTERED_BACKGROUND); });
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    manager.reset();
    TEST_ASSERT(notifier->subscriberCount() == 1, "teardown unsubscribed the manager");

    poster.join();
    TEST_ASSERT(slow_done, "earlier subscriber completed");

    std::cout << "Manager teardown during a lifecycle post Passed!" << std::endl;
    return true;
}

int main() {
    std::cout << "Running SessionManager Tests..." << std::endl;
    set_log_level(LogLevel::ERROR);

    test_start_stop_idempotent();
    test_tie_break_lower_id_invites();
    test_duplicate_found_and_self_discovery();
    test_found_session_member_not_invited();
    test_invitation_always_accepted();
    test_connecting_then_connected();
    test_lost_peer_keeps_session();
    test_reconnect_initiator_invites_immediately();
    test_reconnect_backup_invite_fires();
    test_backup_invite_superseded_by_invitation();
    test_backup_invite_skipped_after_loss();
    test_disconnect_peer_is_expected();
    test_send_and_ack();
    test_send_without_selection();
    test_disconnect_session();
    test_background_then_foreground();
    test_rapid_lifecycle_toggle();
    test_disconnect_in_background();
    test_stale_browser_events_ignored();
    test_service_failures();
    test_reconnect_attempt_cap();
    test_settings_from_config();
    test_found_display_name_from_discovery_info();
    test_unknown_state_leaves_no_context();
    test_unsubscribe_waits_for_running_delivery();
    test_manager_destroyed_during_lifecycle_post();

    if (tests_failed == 0) {
        std::cout << "ALL SESSION MANAGER TESTS PASSED" << std::endl;
        return 0;
    } else {
        std::cerr << tests_failed << " TESTS FAILED" << std::endl;
        return 1;
    }
}
