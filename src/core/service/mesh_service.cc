#include <algorithm>
#include <utility>  // before asio: boost 1.74 awaitable.hpp uses std::exchange
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <core/decode/status_decoder.h>
#include <core/error/error_classifier.h>
#include <core/process/subprocess_runner.h>
#include <core/service/mesh_service.h>
#include <core/util/text.h>
#include <filesystem>
#include <spdlog/spdlog.h>

namespace net = boost::asio;

namespace tailkit::core {

MeshService::MeshService(net::io_context& ioc, ServiceOptions options)
    : MeshService(ioc,
                  std::make_shared<SubprocessRunner>(ioc, options.command_timeout),
                  std::move(options)) {}

MeshService::MeshService(net::io_context& ioc,
                         std::shared_ptr<ProcessRunner> runner,
                         ServiceOptions options)
    : options_(std::move(options))
    , runner_(std::move(runner))
    , strand_(net::make_strand(ioc)) {}

net::awaitable<std::string> MeshService::GetCurrentAddress() {
    return dispatch(currentAddress());
}

net::awaitable<std::string> MeshService::GetHostname() {
    return dispatch(hostname());
}

net::awaitable<ConnectionStatus> MeshService::GetStatus() {
    return dispatch(status());
}

net::awaitable<std::vector<DeviceRecord>> MeshService::ListDevices() {
    return dispatch(devices());
}

bool MeshService::IsAvailable() const {
    std::error_code ec;
    return std::filesystem::exists(options_.binary_path, ec)
           || std::filesystem::exists(options_.fallback_binary_path, ec);
}

net::awaitable<bool> MeshService::IsConnected() {
    try {
        auto current = co_await GetStatus();
        co_return current.online;
    } catch (const MeshError& e) {
        spdlog::debug("Tailscale connectivity check failed: {}", e.what());
    }
    co_return false;
}

std::string MeshService::ValidateAddress(std::string_view output) {
    std::string ip(text::Trim(output));
    if (ip.empty() || !ip.starts_with(tailscale::kAddressPrefix)) {
        throw MeshError::InvalidAddress(std::move(ip));
    }
    return ip;
}

ConnectionStatus MeshService::ProjectStatus(const StatusSnapshot& snapshot) {
    const auto* self_peer = snapshot.FindSelfPeer();
    return ConnectionStatus{
        .hostname = snapshot.self.host_name,
        .ip = self_peer ? self_peer->PrimaryAddress() : std::string{},
        .online = self_peer ? self_peer->online : false,
        .peer_count = snapshot.peers.size() - (self_peer ? 1 : 0),
    };
}

std::vector<DeviceRecord> MeshService::ProjectDevices(const StatusSnapshot& snapshot) {
    std::vector<DeviceRecord> records;
    records.reserve(snapshot.peers.size());
    for (const auto& [public_key, peer] : snapshot.peers) {
        if (public_key == snapshot.self.public_key) {
            continue;
        }
        records.push_back(DeviceRecord{
            .id = public_key,
            .hostname = peer.host_name,
            .ip = peer.PrimaryAddress(),
            .online = peer.online,
            .operating_system = peer.operating_system,
        });
    }
    std::sort(records.begin(), records.end(), [](const auto& lhs, const auto& rhs) {
        return lhs.id < rhs.id;
    });
    return records;
}

template<typename T>
net::awaitable<T> MeshService::dispatch(net::awaitable<T> operation) {
    try {
        co_return co_await net::co_spawn(strand_, std::move(operation), net::use_awaitable);
    } catch (...) {
        throw Classify(std::current_exception());
    }
}

net::awaitable<std::string> MeshService::execute(std::vector<std::string> args) {
    auto result = co_await runner_->Run(options_.binary_path, args);
    co_return TakeOutput(std::move(result));
}

net::awaitable<StatusSnapshot> MeshService::fetchSnapshot() {
    std::vector<std::string> args{std::string(tailscale::kStatusCommand),
                                  std::string(tailscale::kJsonFlag)};
    auto output = co_await execute(std::move(args));
    co_return DecodeStatus(output);
}

net::awaitable<std::string> MeshService::currentAddress() {
    spdlog::debug("Getting Tailscale IP address");

    std::vector<std::string> args{std::string(tailscale::kIpCommand),
                                  std::string(tailscale::kIpv4Flag)};
    auto output = co_await execute(std::move(args));
    auto ip = ValidateAddress(output);

    spdlog::info("Tailscale IP retrieved: {}", ip);
    co_return ip;
}

net::awaitable<std::string> MeshService::hostname() {
    spdlog::debug("Getting Tailscale hostname");

    auto current = co_await status();
    co_return current.hostname;
}

net::awaitable<ConnectionStatus> MeshService::status() {
    spdlog::debug("Getting Tailscale status");

    auto snapshot = co_await fetchSnapshot();
    if (!snapshot.FindSelfPeer()) {
        spdlog::warn("Self node {} missing from peer map", snapshot.self.public_key);
    }
    auto current = ProjectStatus(snapshot);

    spdlog::info("Tailscale status retrieved: hostname={} ip={} online={} peers={}",
                 current.hostname,
                 current.ip,
                 current.online,
                 current.peer_count);
    co_return current;
}

net::awaitable<std::vector<DeviceRecord>> MeshService::devices() {
    spdlog::debug("Listing Tailscale devices");

    auto snapshot = co_await fetchSnapshot();
    auto records = ProjectDevices(snapshot);

    spdlog::info("Tailscale devices listed: {}", records.size());
    co_return records;
}

} // namespace tailkit::core
