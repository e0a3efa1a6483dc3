#include "peer_registry.h"
#include <algorithm>

RemotePeer* PeerRegistry::findMutable(const std::string& peer_id) {
    auto it = std::find_if(m_peers.begin(), m_peers.end(),
                           [&peer_id](const RemotePeer& p) { return p.peer.id == peer_id; });
    return it == m_peers.end() ? nullptr : &*it;
}

const RemotePeer* PeerRegistry::find(const std::string& peer_id) const {
    auto it = std::find_if(m_peers.begin(), m_peers.end(),
                           [&peer_id](const RemotePeer& p) { return p.peer.id == peer_id; });
    return it == m_peers.end() ? nullptr : &*it;
}

bool PeerRegistry::contains(const std::string& peer_id) const {
    return find(peer_id) != nullptr;
}

RemotePeer& PeerRegistry::addConnecting(const PeerId& peer) {
    RemotePeer* existing = findMutable(peer.id);
    if (existing) {
        if (!peer.display_name.empty()) {
            existing->peer.display_name = peer.display_name;
        }
        existing->is_selected = false;
        existing->is_connected = false;
        return *existing;
    }

    RemotePeer entry;
    entry.peer = peer;
    entry.discovered_at = firstSeen(peer.id);
    m_peers.push_back(std::move(entry));
    return m_peers.back();
}

RemotePeer& PeerRegistry::markConnected(const PeerId& peer) {
    RemotePeer* entry = findMutable(peer.id);
    if (!entry) {
        entry = &addConnecting(peer);
    }
    entry->is_connected = true;
    entry->is_selected = true;
    return *entry;
}

bool PeerRegistry::remove(const std::string& peer_id) {
    auto it = std::remove_if(m_peers.begin(), m_peers.end(),
                             [&peer_id](const RemotePeer& p) { return p.peer.id == peer_id; });
    if (it == m_peers.end()) {
        return false;
    }
    m_peers.erase(it, m_peers.end());
    return true;
}

void PeerRegistry::clear() {
    m_peers.clear();
}

std::optional<bool> PeerRegistry::toggleSelection(const std::string& peer_id) {
    RemotePeer* entry = findMutable(peer_id);
    if (!entry) {
        return std::nullopt;
    }
    entry->is_selected = !entry->is_selected;
    return entry->is_selected;
}

std::vector<PeerId> PeerRegistry::selectedPeers() const {
    std::vector<PeerId> out;
    for (const auto& p : m_peers) {
        if (p.is_selected) out.push_back(p.peer);
    }
    return out;
}

void PeerRegistry::recordFirstSeen(const std::string& peer_id, TimePoint when) {
    m_first_seen.emplace(peer_id, when);
}

std::optional<PeerRegistry::TimePoint> PeerRegistry::firstSeen(const std::string& peer_id) const {
    auto it = m_first_seen.find(peer_id);
    if (it == m_first_seen.end()) return std::nullopt;
    return it->second;
}

std::optional<PeerRegistry::TimePoint> PeerRegistry::takeFirstSeen(const std::string& peer_id) {
    auto it = m_first_seen.find(peer_id);
    if (it == m_first_seen.end()) return std::nullopt;
    TimePoint when = it->second;
    m_first_seen.erase(it);
    return when;
}

void PeerRegistry::clearFirstSeen(const std::string& peer_id) {
    m_first_seen.erase(peer_id);
}

void PeerRegistry::clearAllFirstSeen() {
    m_first_seen.clear();
}
