#include <core/decode/status_decoder.h>
#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>

using json = nlohmann::json;

namespace tailkit::core {

namespace {

std::string_view TypeName(const json& value) {
    return value.type_name();
}

const json& RequireField(const json& object, const char* key, const std::string& path) {
    auto it = object.find(key);
    if (it == object.end()) {
        throw DecodeError(fmt::format("missing field {}.{}", path, key));
    }
    return *it;
}

const json& RequireObject(const json& object, const char* key, const std::string& path) {
    const auto& value = RequireField(object, key, path);
    if (!value.is_object()) {
        throw DecodeError(
            fmt::format("{}.{}: expected object, got {}", path, key, TypeName(value)));
    }
    return value;
}

std::string RequireString(const json& object, const char* key, const std::string& path) {
    const auto& value = RequireField(object, key, path);
    if (!value.is_string()) {
        throw DecodeError(
            fmt::format("{}.{}: expected string, got {}", path, key, TypeName(value)));
    }
    return value.get<std::string>();
}

bool RequireBool(const json& object, const char* key, const std::string& path) {
    const auto& value = RequireField(object, key, path);
    if (!value.is_boolean()) {
        throw DecodeError(
            fmt::format("{}.{}: expected boolean, got {}", path, key, TypeName(value)));
    }
    return value.get<bool>();
}

std::vector<std::string> RequireStringArray(const json& object,
                                            const char* key,
                                            const std::string& path) {
    const auto& value = RequireField(object, key, path);
    if (!value.is_array()) {
        throw DecodeError(
            fmt::format("{}.{}: expected array, got {}", path, key, TypeName(value)));
    }
    std::vector<std::string> items;
    items.reserve(value.size());
    for (std::size_t i = 0; i < value.size(); ++i) {
        if (!value[i].is_string()) {
            throw DecodeError(fmt::format("{}.{}[{}]: expected string, got {}",
                                          path,
                                          key,
                                          i,
                                          TypeName(value[i])));
        }
        items.push_back(value[i].get<std::string>());
    }
    return items;
}

SelfNode DecodeSelf(const json& root) {
    const auto& self = RequireObject(root, "Self", "$");
    return SelfNode{
        .public_key = RequireString(self, "PublicKey", "$.Self"),
        .host_name = RequireString(self, "HostName", "$.Self"),
    };
}

PeerEntry DecodePeer(const json& peer, const std::string& path) {
    if (!peer.is_object()) {
        throw DecodeError(fmt::format("{}: expected object, got {}", path, TypeName(peer)));
    }
    return PeerEntry{
        .host_name = RequireString(peer, "HostName", path),
        .online = RequireBool(peer, "Online", path),
        .addresses = RequireStringArray(peer, "TailscaleIPs", path),
        .operating_system = RequireString(peer, "OS", path),
    };
}

} // namespace

StatusSnapshot DecodeStatus(std::string_view json_text) {
    json root;
    try {
        root = json::parse(json_text.begin(), json_text.end());
    } catch (const json::parse_error& e) {
        throw DecodeError(fmt::format("malformed JSON: {}", e.what()));
    }
    if (!root.is_object()) {
        throw DecodeError(fmt::format("$: expected object, got {}", TypeName(root)));
    }

    StatusSnapshot snapshot;
    snapshot.self = DecodeSelf(root);

    const auto& peers = RequireObject(root, "Peer", "$");
    snapshot.peers.reserve(peers.size());
    for (auto it = peers.begin(); it != peers.end(); ++it) {
        snapshot.peers.emplace(it.key(),
                               DecodePeer(it.value(), fmt::format("$.Peer[\"{}\"]", it.key())));
    }
    return snapshot;
}

} // namespace tailkit::core
