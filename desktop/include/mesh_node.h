#pragma once

#include <memory>
#include <string>
#include <vector>

class SessionManager;
class LoopbackMedium;
class LifecycleNotifier;

/**
 * @brief Desktop node wrapper.
 *
 * Owns the local SessionManager plus a handful of simulated neighbours, all
 * sharing one in-process LoopbackMedium. The CLI drives the local node through
 * session() and uses the medium controls to simulate link loss.
 */
class MeshNode {
public:
    MeshNode();
    ~MeshNode();

    MeshNode(const MeshNode&) = delete;
    MeshNode& operator=(const MeshNode&) = delete;

    // An empty peer_id generates a fresh one
    bool start(const std::string& peer_id, const std::string& display_name, int simulated_peers,
               std::string* error = nullptr);
    void stop();
    bool isRunning() const { return m_session_manager != nullptr; }

    // Only valid while running
    SessionManager& session();

    void enterBackground();
    void enterForeground();

    // Severs the local node's link to peer_id
    bool dropLink(const std::string& peer_id);
    // Moves a simulated neighbour in or out of range
    bool setPeerVisible(const std::string& peer_id, bool visible);

    std::string getPeerId() const;
    std::vector<std::string> simulatedPeerIds() const;

private:
    std::shared_ptr<LoopbackMedium> m_medium;
    std::shared_ptr<LifecycleNotifier> m_lifecycle;
    std::unique_ptr<SessionManager> m_session_manager;
    std::vector<std::unique_ptr<SessionManager>> m_simulated;
};
