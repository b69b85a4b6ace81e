#pragma once

#include "peer_entry.h"
#include "self_node.h"
#include <string>
#include <unordered_map>

namespace tailkit::core {

// One decoded `status --json` document. Never mutated after decoding, a new
// fetch produces a new snapshot.
struct StatusSnapshot {
    SelfNode self;
    std::unordered_map<std::string, PeerEntry> peers; // keyed by public key

    [[nodiscard]] const PeerEntry* FindSelfPeer() const {
        auto it = peers.find(self.public_key);
        return it == peers.end() ? nullptr : &it->second;
    }

    bool operator==(const StatusSnapshot&) const = default;
};

} // namespace tailkit::core
