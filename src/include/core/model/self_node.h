#pragma once

#include <string>

namespace tailkit::core {

struct SelfNode {
    std::string public_key; // unique within a snapshot
    std::string host_name;

    bool operator==(const SelfNode&) const = default;
};

} // namespace tailkit::core
