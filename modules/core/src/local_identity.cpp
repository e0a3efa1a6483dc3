#include "local_identity.h"
#include "constants.h"
#include "logger.h"
#include <sodium.h>
#include <stdexcept>
#include <vector>

namespace {
    void ensure_sodium() {
        // sodium_init() returns 1 when already initialised
        if (sodium_init() < 0) {
            LOG_ERROR("LocalIdentity: libsodium initialization failed");
            throw std::runtime_error("libsodium initialization failed");
        }
    }
}

std::string generate_random_hex(size_t byte_count) {
    ensure_sodium();
    std::vector<unsigned char> raw(byte_count);
    randombytes_buf(raw.data(), raw.size());

    std::string hex(byte_count * 2 + 1, '\0');
    sodium_bin2hex(&hex[0], hex.size(), raw.data(), raw.size());
    hex.resize(byte_count * 2);
    sodium_memzero(raw.data(), raw.size());
    return hex;
}

LocalIdentity LocalIdentity::generate(const std::string& display_name) {
    std::string id = std::string(PEER_ID_PREFIX) + generate_random_hex(PEER_ID_RANDOM_BYTES);
    LOG_DEBUG("LocalIdentity: generated id " + id);
    return LocalIdentity(PeerId(id, display_name));
}

LocalIdentity LocalIdentity::withId(const std::string& id, const std::string& display_name) {
    if (id.empty()) {
        throw std::invalid_argument("LocalIdentity: empty peer id");
    }
    return LocalIdentity(PeerId(id, display_name));
}
