#ifndef PEER_H
#define PEER_H

#include "peer_id.h"
#include <chrono>
#include <optional>

// Registry entry exposed to the UI. is_connected follows the session state,
// not discovery visibility.
struct RemotePeer {
    PeerId peer;
    bool is_selected = false;
    bool is_connected = false;
    std::optional<std::chrono::system_clock::time_point> discovered_at;
};

#endif // PEER_H
