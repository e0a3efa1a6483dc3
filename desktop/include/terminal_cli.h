/**
 * terminal_cli.h - line-oriented front end for a MeshNode
 *
 * Plain mode reads commands from stdin, one per line. Daemon mode never reads
 * stdin and just keeps the node alive until stop() is called (SIGINT/SIGTERM).
 */

#ifndef TERMINAL_CLI_H
#define TERMINAL_CLI_H

#include <atomic>
#include <ostream>
#include <string>

class MeshNode;
struct MeshSnapshot;

class TerminalCLI {
public:
    TerminalCLI(MeshNode& node, std::ostream& out, bool daemon_mode = false);
    ~TerminalCLI();

    void run();
    // Safe from a signal handler
    void stop();

    // Returns false once the command asks the CLI to exit
    bool process_command(const std::string& input);

private:
    MeshNode& node;
    std::ostream& out;
    bool daemon_mode_;
    std::atomic<bool> running{false};

    void run_plain();
    void run_daemon();

    // Command handlers
    void cmd_help();
    void cmd_status();
    void cmd_list_peers();
    void cmd_logs(const std::string& count);
    void cmd_browse(const std::string& arg);
    void cmd_advertise(const std::string& arg);
    void cmd_select(const std::string& peer_id);
    void cmd_send();
    void cmd_disconnect(const std::string& peer_id);
    void cmd_disconnect_session();
    void cmd_bgdisconnect(const std::string& arg);
    void cmd_drop(const std::string& peer_id);
    void cmd_visibility(const std::string& peer_id, bool visible);
    void cmd_clear();

    // "on"/"off" or empty for toggle; sets *ok to false on anything else
    static int parse_switch(const std::string& arg, bool* ok);
    void print_peers(const MeshSnapshot& snapshot);
};

#endif // TERMINAL_CLI_H
