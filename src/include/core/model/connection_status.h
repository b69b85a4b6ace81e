#pragma once

#include <cstddef>
#include <nlohmann/json.hpp>
#include <string>

namespace tailkit::core {

struct ConnectionStatus {
    std::string hostname;
    std::string ip;         // empty when the local node has no address yet
    bool online = false;
    std::size_t peer_count = 0; // peers other than this device

    bool operator==(const ConnectionStatus&) const = default;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(ConnectionStatus, hostname, ip, online, peer_count)
};

} // namespace tailkit::core
