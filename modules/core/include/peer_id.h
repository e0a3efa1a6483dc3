#ifndef PEER_ID_H
#define PEER_ID_H

#include <string>
#include <utility>

// Identity of a mesh participant. Equality and ordering use the
// opaque id only; display names are not unique.
struct PeerId {
    std::string id;
    std::string display_name;

    PeerId() = default;
    PeerId(std::string id_, std::string display_name_ = "")
        : id(std::move(id_)), display_name(std::move(display_name_)) {}

    bool empty() const { return id.empty(); }

    // "name (id)" or just the id when no name is known
    std::string label() const {
        return display_name.empty() ? id : display_name + " (" + id + ")";
    }
};

inline bool operator==(const PeerId& a, const PeerId& b) { return a.id == b.id; }
inline bool operator!=(const PeerId& a, const PeerId& b) { return a.id != b.id; }
inline bool operator<(const PeerId& a, const PeerId& b) { return a.id < b.id; }

#endif // PEER_ID_H
