#include "terminal_cli.h"
#include "mesh_node.h"
#include "session_manager.h"
#include "log_journal.h"
#include "logger.h"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <sstream>
#include <thread>
#include <unistd.h>

namespace {
    const char* yes_no(bool value) { return value ? "yes" : "no"; }
}

TerminalCLI::TerminalCLI(MeshNode& node, std::ostream& out, bool daemon_mode)
    : node(node), out(out), daemon_mode_(daemon_mode) {}

TerminalCLI::~TerminalCLI() {
    stop();
}

void TerminalCLI::run() {
    running = true;
    if (daemon_mode_) {
        run_daemon();
    } else {
        run_plain();
    }
}

void TerminalCLI::stop() {
    running = false;
}

void TerminalCLI::run_plain() {
    out << "nearmesh (plain mode). Type 'help' for commands. Ctrl-D to exit." << std::endl;

    std::string line;
    while (running) {
        out << "nearmesh> " << std::flush;
        if (!std::getline(std::cin, line)) {
            break;
        }
        if (line.empty()) {
            continue;
        }
        if (!process_command(line)) {
            break;
        }
    }

    out << "Goodbye!" << std::endl;
}

void TerminalCLI::run_daemon() {
    out << "nearmesh daemon mode started. Use 'kill -TERM " << getpid() << "' to stop." << std::endl;
    out << "Peer ID: " << node.getPeerId() << std::endl;

    while (running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    out << "Goodbye!" << std::endl;
}

int TerminalCLI::parse_switch(const std::string& arg, bool* ok) {
    *ok = true;
    if (arg.empty()) return -1;
    if (arg == "on" || arg == "1" || arg == "true") return 1;
    if (arg == "off" || arg == "0" || arg == "false") return 0;
    *ok = false;
    return -1;
}

bool TerminalCLI::process_command(const std::string& input) {
    std::istringstream iss(input);
    std::string cmd;
    iss >> cmd;
    std::transform(cmd.begin(), cmd.end(), cmd.begin(), ::tolower);
    std::string arg;
    iss >> arg;

    if (cmd.empty()) {
        return true;
    }
    if (cmd == "quit" || cmd == "exit" || cmd == "q") {
        running = false;
        return false;
    }
    if (cmd == "help" || cmd == "h" || cmd == "?") {
        cmd_help();
        return true;
    }
    if (!node.isRunning()) {
        out << "Node is not running" << std::endl;
        return true;
    }

    if (cmd == "status" || cmd == "s") {
        cmd_status();
    } else if (cmd == "peers" || cmd == "ls") {
        cmd_list_peers();
    } else if (cmd == "logs" || cmd == "log") {
        cmd_logs(arg);
    } else if (cmd == "browse") {
        cmd_browse(arg);
    } else if (cmd == "advertise" || cmd == "adv") {
        cmd_advertise(arg);
    } else if (cmd == "select" || cmd == "sel") {
        cmd_select(arg);
    } else if (cmd == "send") {
        cmd_send();
    } else if (cmd == "disconnect") {
        cmd_disconnect(arg);
    } else if (cmd == "disconnect-session") {
        cmd_disconnect_session();
    } else if (cmd == "background" || cmd == "bg") {
        node.enterBackground();
        out << "Background notification posted" << std::endl;
    } else if (cmd == "foreground" || cmd == "fg") {
        node.enterForeground();
        out << "Foreground notification posted" << std::endl;
    } else if (cmd == "bgdisconnect") {
        cmd_bgdisconnect(arg);
    } else if (cmd == "drop") {
        cmd_drop(arg);
    } else if (cmd == "hide") {
        cmd_visibility(arg, false);
    } else if (cmd == "show") {
        cmd_visibility(arg, true);
    } else if (cmd == "clear") {
        cmd_clear();
    } else {
        out << "Unknown: " << cmd << " (type 'help')" << std::endl;
    }
    return true;
}

void TerminalCLI::cmd_help() {
    out << "Commands:\n"
        << "  help                  Show this help\n"
        << "  status                Local node and service state\n"
        << "  peers                 Session peers ([x] = selected)\n"
        << "  logs [n]              Newest n log entries (default 20)\n"
        << "  browse [on|off]       Start/stop browsing (toggle without argument)\n"
        << "  advertise [on|off]    Start/stop advertising (toggle without argument)\n"
        << "  select <id>           Toggle a peer's selection\n"
        << "  send                  Send the test payload to the selected peers\n"
        << "  disconnect <id>       Disconnect one peer, no reconnection\n"
        << "  disconnect-session    Leave the session\n"
        << "  background            Simulate entering background\n"
        << "  foreground            Simulate returning to foreground\n"
        << "  bgdisconnect [on|off] Leave the session when entering background\n"
        << "  drop <id>             Sever the radio link to a peer\n"
        << "  hide <id> / show <id> Move a simulated peer out of or into range\n"
        << "  clear                 Clear the log journal\n"
        << "  quit                  Exit" << std::endl;
}

void TerminalCLI::cmd_status() {
    const MeshSnapshot snapshot = node.session().snapshot();
    const auto& settings = node.session().settings();
    const size_t connected = std::count_if(snapshot.peers.begin(), snapshot.peers.end(),
                                           [](const RemotePeer& p) { return p.is_connected; });

    out << "Peer ID:        " << node.getPeerId() << "\n"
        << "Service type:   " << settings.service_type << "\n"
        << "Running:        " << yes_no(snapshot.is_running) << "\n"
        << "Browsing:       " << yes_no(snapshot.is_browsing) << "\n"
        << "Advertising:    " << yes_no(snapshot.is_advertising) << "\n"
        << "Background:     " << yes_no(snapshot.in_background) << "\n"
        << "BG disconnect:  " << yes_no(snapshot.disconnect_in_background) << "\n"
        << "Peers:          " << snapshot.peers.size() << " (" << connected << " connected)\n"
        << "Reconnect:      " << node.session().reconnectStatusJson() << std::endl;
}

void TerminalCLI::print_peers(const MeshSnapshot& snapshot) {
    if (snapshot.peers.empty()) {
        out << "No peers" << std::endl;
        return;
    }
    for (const auto& peer : snapshot.peers) {
        out << (peer.is_selected ? "  [x] " : "  [ ] ") << peer.peer.label()
            << (peer.is_connected ? "  connected" : "  connecting") << "\n";
    }
    out << std::flush;
}

void TerminalCLI::cmd_list_peers() {
    print_peers(node.session().snapshot());

    const auto simulated = node.simulatedPeerIds();
    if (!simulated.empty()) {
        out << "Simulated neighbours:" << std::endl;
        for (const auto& id : simulated) {
            out << "  " << id << std::endl;
        }
    }
}

void TerminalCLI::cmd_logs(const std::string& count) {
    size_t limit = 20;
    if (!count.empty()) {
        try {
            limit = static_cast<size_t>(std::max(1, std::stoi(count)));
        } catch (const std::exception&) {
            out << "Usage: logs [n]" << std::endl;
            return;
        }
    }

    const auto entries = node.session().logs();
    const size_t shown = std::min(limit, entries.size());
    for (size_t i = 0; i < shown; ++i) {
        out << format_log_entry(entries[i]) << "\n";
    }
    out << "(" << shown << " of " << entries.size() << ")" << std::endl;
}

void TerminalCLI::cmd_browse(const std::string& arg) {
    bool ok = false;
    const int value = parse_switch(arg, &ok);
    if (!ok) {
        out << "Usage: browse [on|off]" << std::endl;
        return;
    }
    if (value < 0) node.session().toggleBrowsing();
    else node.session().setBrowsing(value == 1);
}

void TerminalCLI::cmd_advertise(const std::string& arg) {
    bool ok = false;
    const int value = parse_switch(arg, &ok);
    if (!ok) {
        out << "Usage: advertise [on|off]" << std::endl;
        return;
    }
    if (value < 0) node.session().toggleAdvertising();
    else node.session().setAdvertising(value == 1);
}

void TerminalCLI::cmd_select(const std::string& peer_id) {
    if (peer_id.empty()) {
        out << "Usage: select <peer_id>" << std::endl;
        return;
    }
    node.session().togglePeerSelection(peer_id);
}

void TerminalCLI::cmd_send() {
    node.session().sendTestPayload();
}

void TerminalCLI::cmd_disconnect(const std::string& peer_id) {
    if (peer_id.empty()) {
        out << "Usage: disconnect <peer_id>" << std::endl;
        return;
    }
    node.session().disconnectPeer(peer_id);
}

void TerminalCLI::cmd_disconnect_session() {
    node.session().disconnectSession();
}

void TerminalCLI::cmd_bgdisconnect(const std::string& arg) {
    bool ok = false;
    const int value = parse_switch(arg, &ok);
    if (!ok) {
        out << "Usage: bgdisconnect [on|off]" << std::endl;
        return;
    }
    const bool enabled = value < 0 ? !node.session().snapshot().disconnect_in_background : value == 1;
    node.session().setDisconnectInBackground(enabled);
    out << "Disconnect in background: " << (enabled ? "on" : "off") << std::endl;
}

void TerminalCLI::cmd_drop(const std::string& peer_id) {
    if (peer_id.empty()) {
        out << "Usage: drop <peer_id>" << std::endl;
        return;
    }
    if (!node.dropLink(peer_id)) {
        out << "No link to " << peer_id << std::endl;
    }
}

void TerminalCLI::cmd_visibility(const std::string& peer_id, bool visible) {
    if (peer_id.empty()) {
        out << "Usage: " << (visible ? "show" : "hide") << " <peer_id>" << std::endl;
        return;
    }
    if (!node.setPeerVisible(peer_id, visible)) {
        out << "Not a simulated peer: " << peer_id << std::endl;
    }
}

void TerminalCLI::cmd_clear() {
    node.session().clearLogs();
    out << "Logs cleared" << std::endl;
}
