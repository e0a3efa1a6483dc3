#ifndef PEER_RECONNECT_POLICY_H
#define PEER_RECONNECT_POLICY_H

#include "peer_id.h"
#include <mutex>
#include <string>
#include <unordered_map>

/**
 * Peer Reconnect Policy for the nearby mesh
 *
 * - Deterministic tie-break: of any two peers, only the one with the lower id
 *   initiates invitations. The order is total and antisymmetric, so two peers
 *   that see each other at the same time issue exactly one invitation.
 * - Per-peer attempt counter for unexpected losses, reset on a successful
 *   connection. An optional cap stops reconnecting after N consecutive
 *   attempts (0 = unlimited).
 */

struct ReconnectPlan {
    int attempt = 0;          // 1-based attempt number for this loss streak
    bool initiate = false;    // true: invite now; false: arm the backup invite
    bool exhausted = false;   // cap reached, do nothing
};

class PeerReconnectPolicy {
public:
    explicit PeerReconnectPolicy(int max_attempts = 0);

    static bool shouldInitiate(const PeerId& local, const PeerId& remote);

    // Called once per unexpected loss of a session member
    ReconnectPlan onConnectionLost(const PeerId& local, const PeerId& remote);

    // Successful connection
    void reset(const std::string& peer_id);
    void resetAll();

    int attempts(const std::string& peer_id) const;
    int maxAttempts() const { return m_max_attempts; }

    // {"max_attempts":N,"peers":{"id":attempts,...}}
    std::string get_status_json() const;

private:
    int m_max_attempts;

    mutable std::mutex m_mutex;
    std::unordered_map<std::string, int> m_attempts;
};

#endif // PEER_RECONNECT_POLICY_H
