#ifndef LOCAL_IDENTITY_H
#define LOCAL_IDENTITY_H

#include "peer_id.h"
#include <string>

/**
 * @brief Immutable identity of the local node.
 *
 * Generated ids are "nearmesh-" followed by 32 lowercase hex characters drawn
 * from libsodium's CSPRNG. Throws std::runtime_error if libsodium cannot be
 * initialised.
 */
class LocalIdentity {
public:
    static LocalIdentity generate(const std::string& display_name);
    static LocalIdentity withId(const std::string& id, const std::string& display_name);

    const PeerId& peer() const { return m_peer; }
    const std::string& id() const { return m_peer.id; }
    const std::string& displayName() const { return m_peer.display_name; }

private:
    explicit LocalIdentity(PeerId peer) : m_peer(std::move(peer)) {}

    PeerId m_peer;
};

// Random hex token of byte_count bytes (2 * byte_count characters)
std::string generate_random_hex(size_t byte_count);

#endif // LOCAL_IDENTITY_H
