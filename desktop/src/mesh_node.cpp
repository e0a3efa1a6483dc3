#include "mesh_node.h"
#include "session_manager.h"
#include "loopback_medium.h"
#include "lifecycle_notifier.h"
#include "local_identity.h"
#include "logger.h"

#include <algorithm>
#include <stdexcept>

MeshNode::MeshNode() = default;

MeshNode::~MeshNode() {
    stop();
}

bool MeshNode::start(const std::string& peer_id, const std::string& display_name, int simulated_peers,
                     std::string* error) {
    if (m_session_manager) {
        if (error) *error = "node already running";
        return false;
    }

    try {
        LocalIdentity identity = peer_id.empty() ? LocalIdentity::generate(display_name)
                                                 : LocalIdentity::withId(peer_id, display_name);
        setSessionId(identity.id());

        m_medium = std::make_shared<LoopbackMedium>();
        m_lifecycle = std::make_shared<LifecycleNotifier>();
        auto factory = std::make_shared<LoopbackTransportFactory>(m_medium);

        // Neighbours always browse and advertise; they never go to background
        SessionSettings sim_settings = SessionSettings::fromConfig();
        sim_settings.auto_start = true;
        sim_settings.disconnect_in_background = false;
        for (int i = 0; i < simulated_peers; ++i) {
            auto neighbour = std::make_unique<SessionManager>(
                LocalIdentity::generate("sim-" + std::to_string(i + 1)), factory,
                std::make_shared<LifecycleNotifier>(), sim_settings);
            std::string sim_error;
            if (!neighbour->start(&sim_error)) {
                LOG_WARN("MAIN: simulated peer failed to start: " + sim_error);
                continue;
            }
            m_simulated.push_back(std::move(neighbour));
        }

        m_session_manager = std::make_unique<SessionManager>(std::move(identity), factory, m_lifecycle);
        if (!m_session_manager->start(error)) {
            m_session_manager.reset();
            stop();
            return false;
        }
    } catch (const std::exception& e) {
        if (error) *error = e.what();
        m_session_manager.reset();
        stop();
        return false;
    }

    LOG_INFO("MAIN: node " + getPeerId() + " started with " + std::to_string(m_simulated.size()) +
             " simulated peer(s)");
    return true;
}

void MeshNode::stop() {
    if (m_session_manager) {
        m_session_manager->stop();
        m_session_manager.reset();
    }
    for (auto& neighbour : m_simulated) {
        neighbour->stop();
    }
    m_simulated.clear();
    m_lifecycle.reset();
    m_medium.reset();
}

SessionManager& MeshNode::session() {
    if (!m_session_manager) {
        throw std::logic_error("MeshNode: not running");
    }
    return *m_session_manager;
}

void MeshNode::enterBackground() {
    if (m_lifecycle) m_lifecycle->post(AppTransition::ENTERED_BACKGROUND);
}

void MeshNode::enterForeground() {
    if (m_lifecycle) m_lifecycle->post(AppTransition::ENTERED_FOREGROUND);
}

bool MeshNode::dropLink(const std::string& peer_id) {
    if (!m_medium || !m_session_manager) return false;
    return m_medium->dropLink(getPeerId(), peer_id);
}

bool MeshNode::setPeerVisible(const std::string& peer_id, bool visible) {
    if (!m_medium) return false;
    const auto ids = simulatedPeerIds();
    if (std::find(ids.begin(), ids.end(), peer_id) == ids.end()) return false;
    m_medium->setVisible(peer_id, visible);
    return true;
}

std::string MeshNode::getPeerId() const {
    return m_session_manager ? m_session_manager->localIdentity().id() : std::string();
}

std::vector<std::string> MeshNode::simulatedPeerIds() const {
    std::vector<std::string> ids;
    for (const auto& neighbour : m_simulated) {
        ids.push_back(neighbour->localIdentity().id());
    }
    return ids;
}
