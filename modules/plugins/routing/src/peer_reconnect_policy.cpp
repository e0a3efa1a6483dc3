#include "peer_reconnect_policy.h"
#include "logger.h"
#include <nlohmann/json.hpp>

PeerReconnectPolicy::PeerReconnectPolicy(int max_attempts)
    : m_max_attempts(max_attempts < 0 ? 0 : max_attempts) {}

bool PeerReconnectPolicy::shouldInitiate(const PeerId& local, const PeerId& remote) {
    return local.id < remote.id;
}

ReconnectPlan PeerReconnectPolicy::onConnectionLost(const PeerId& local, const PeerId& remote) {
    ReconnectPlan plan;
    std::lock_guard<std::mutex> lock(m_mutex);

    int& count = m_attempts[remote.id];
    if (m_max_attempts > 0 && count >= m_max_attempts) {
        plan.attempt = count;
        plan.exhausted = true;
        LOG_DEBUG("ReconnectPolicy: " + remote.id + " exhausted after " + std::to_string(count) + " attempt(s)");
        return plan;
    }

    plan.attempt = ++count;
    plan.initiate = shouldInitiate(local, remote);
    return plan;
}

void PeerReconnectPolicy::reset(const std::string& peer_id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_attempts.erase(peer_id);
}

void PeerReconnectPolicy::resetAll() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_attempts.clear();
}

int PeerReconnectPolicy::attempts(const std::string& peer_id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_attempts.find(peer_id);
    return it == m_attempts.end() ? 0 : it->second;
}

std::string PeerReconnectPolicy::get_status_json() const {
    nlohmann::json status;
    std::lock_guard<std::mutex> lock(m_mutex);
    status["max_attempts"] = m_max_attempts;
    status["peers"] = nlohmann::json::object();
    for (const auto& entry : m_attempts) {
        status["peers"][entry.first] = entry.second;
    }
    return status.dump();
}
