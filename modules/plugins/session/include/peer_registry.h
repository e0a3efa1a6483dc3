#ifndef PEER_REGISTRY_H
#define PEER_REGISTRY_H

#include "peer.h"
#include <chrono>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

/**
 * @brief Known session members plus first-seen timestamps.
 *
 * Owned and mutated by the orchestration executor only. Entries keep their
 * registration order. A peer marked connected is always present.
 */
class PeerRegistry {
public:
    using TimePoint = std::chrono::system_clock::time_point;

    // Creates or resets the entry for a connecting peer (not selected, not connected).
    RemotePeer& addConnecting(const PeerId& peer);
    // Marks connected and selected, creating the entry if the connecting
    // notification was never seen.
    RemotePeer& markConnected(const PeerId& peer);
    bool remove(const std::string& peer_id);
    void clear();

    const RemotePeer* find(const std::string& peer_id) const;
    bool contains(const std::string& peer_id) const;

    // Returns the new selection flag, or nullopt for an unknown peer
    std::optional<bool> toggleSelection(const std::string& peer_id);
    std::vector<PeerId> selectedPeers() const;
    const std::vector<RemotePeer>& list() const { return m_peers; }
    size_t size() const { return m_peers.size(); }

    // First sighting, kept only for the first call per peer
    void recordFirstSeen(const std::string& peer_id, TimePoint when);
    std::optional<TimePoint> firstSeen(const std::string& peer_id) const;
    // Returns and clears the timestamp
    std::optional<TimePoint> takeFirstSeen(const std::string& peer_id);
    void clearFirstSeen(const std::string& peer_id);
    void clearAllFirstSeen();

private:
    RemotePeer* findMutable(const std::string& peer_id);

    std::vector<RemotePeer> m_peers;
    std::unordered_map<std::string, TimePoint> m_first_seen;
};

#endif // PEER_REGISTRY_H
