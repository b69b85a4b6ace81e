#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace tailkit::core {

struct DeviceRecord {
    std::string id; // peer public key
    std::string hostname;
    std::string ip;
    bool online = false;
    std::string operating_system;

    bool operator==(const DeviceRecord&) const = default;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(DeviceRecord, id, hostname, ip, online, operating_system)
};

} // namespace tailkit::core
