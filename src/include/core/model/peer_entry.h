#pragma once

#include <string>
#include <vector>

namespace tailkit::core {

struct PeerEntry {
    std::string host_name;
    bool online = false;
    std::vector<std::string> addresses; // IPv4 first, then IPv6; may be empty
    std::string operating_system;

    // First address or empty
    [[nodiscard]] std::string PrimaryAddress() const {
        return addresses.empty() ? std::string{} : addresses.front();
    }

    bool operator==(const PeerEntry&) const = default;
};

} // namespace tailkit::core
