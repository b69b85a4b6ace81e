#include <utility>  // before asio: boost 1.74 awaitable.hpp uses std::exchange
#include <boost/asio/co_spawn.hpp>
#include <cli/cli_manager.h>
#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace net = boost::asio;
using json = nlohmann::json;

using namespace tailkit::core;

namespace tailkit::cli {

CliManager::CliManager(net::io_context& ioc,
                       MeshService& service,
                       std::ostream& out,
                       std::ostream& err,
                       bool json_output)
    : ioc_(ioc)
    , service_(service)
    , out_(out)
    , err_(err)
    , json_output_(json_output) {}

int CliManager::Execute(const std::string& command) {
    if (command == "available") {
        return handle_available() ? 0 : 1;
    }

    int exit_code = 0;
    net::co_spawn(ioc_, dispatch(command), [&](std::exception_ptr e) {
        if (!e) {
            return;
        }
        exit_code = 1;
        try {
            std::rethrow_exception(e);
        } catch (const MeshError& error) {
            print_error(error);
        } catch (const std::exception& ex) {
            spdlog::error("Command '{}' failed: {}", command, ex.what());
            err_ << "error: " << ex.what() << '\n';
        }
    });
    ioc_.run();
    ioc_.restart();
    return exit_code;
}

net::awaitable<void> CliManager::dispatch(std::string command) {
    require_installed();

    if (command == "ip") {
        co_await handle_ip();
    } else if (command == "hostname") {
        co_await handle_hostname();
    } else if (command == "status") {
        co_await handle_status();
    } else if (command == "devices") {
        co_await handle_devices();
    } else if (command == "connected") {
        co_await handle_connected();
    } else {
        throw std::runtime_error("Unknown command: " + command);
    }
}

net::awaitable<void> CliManager::handle_ip() {
    auto ip = co_await service_.GetCurrentAddress();
    if (json_output_) {
        out_ << json{{"ip", ip}}.dump(2) << '\n';
    } else {
        out_ << ip << '\n';
    }
}

net::awaitable<void> CliManager::handle_hostname() {
    auto hostname = co_await service_.GetHostname();
    if (json_output_) {
        out_ << json{{"hostname", hostname}}.dump(2) << '\n';
    } else {
        out_ << hostname << '\n';
    }
}

net::awaitable<void> CliManager::handle_status() {
    auto status = co_await service_.GetStatus();
    print_status(status);
}

net::awaitable<void> CliManager::handle_devices() {
    auto devices = co_await service_.ListDevices();
    print_device_list(devices);
}

net::awaitable<void> CliManager::handle_connected() {
    const bool connected = co_await service_.IsConnected();
    if (!connected) {
        throw MeshError::NotConnected();
    }
    if (json_output_) {
        out_ << json{{"connected", true}}.dump(2) << '\n';
    } else {
        out_ << "connected\n";
    }
}

bool CliManager::handle_available() {
    bool available = service_.IsAvailable();
    if (json_output_) {
        out_ << json{{"available", available}}.dump(2) << '\n';
    } else {
        out_ << (available ? "yes" : "no") << '\n';
    }
    return available;
}

void CliManager::require_installed() {
    if (!service_.IsAvailable()) {
        throw MeshError::NotInstalled();
    }
}

void CliManager::print_status(const ConnectionStatus& status) {
    if (json_output_) {
        out_ << json(status).dump(2) << '\n';
        return;
    }
    out_ << "hostname: " << status.hostname << '\n'
         << "ip:       " << (status.ip.empty() ? "-" : status.ip) << '\n'
         << "online:   " << (status.online ? "yes" : "no") << '\n'
         << "peers:    " << status.peer_count << '\n';
}

void CliManager::print_device_list(const std::vector<DeviceRecord>& devices) {
    if (json_output_) {
        out_ << json(devices).dump(2) << '\n';
        return;
    }
    if (devices.empty()) {
        out_ << "No other devices in the tailnet.\n";
        return;
    }
    out_ << fmt::format("{:<32} {:<16} {:<8} {:<10} {}\n", "HOSTNAME", "IP", "STATUS", "OS", "ID");
    for (const auto& device : devices) {
        out_ << fmt::format("{:<32} {:<16} {:<8} {:<10} {}\n",
                            device.hostname,
                            device.ip.empty() ? "-" : device.ip,
                            device.online ? "online" : "offline",
                            device.operating_system,
                            device.id);
    }
}

void CliManager::print_error(const MeshError& error) {
    if (json_output_) {
        err_ << json{{"error", error.ToJson()}}.dump(2) << '\n';
        return;
    }
    err_ << "error: " << error.description() << '\n';
    auto suggestion = error.recovery_suggestion();
    if (!suggestion.empty()) {
        err_ << "hint:  " << suggestion << '\n';
    }
}

} // namespace tailkit::cli
