#pragma once

#include <utility>  // before asio: boost 1.74 awaitable.hpp uses std::exchange
#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/strand.hpp>
#include <chrono>
#include <core/constant/tailscale.h>
#include <core/model.h>
#include <core/process/process_runner.h>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace tailkit::core {

struct ServiceOptions {
    std::string binary_path{tailscale::kDefaultBinaryPath};
    std::string fallback_binary_path{tailscale::kFallbackBinaryPath}; // only for IsAvailable()
    std::chrono::milliseconds command_timeout = process::kNoTimeout;
};

/*
    MeshService wraps the tailscale command line tool.

    Every operation runs on the service's strand and performs exactly one
    invocation of the tool (nothing is cached). Failures surface as MeshError.

    Example usage:
        boost::asio::io_context ioc;
        MeshService service(ioc);
        co_spawn(ioc, [&]() -> awaitable<void> {
            auto ip = co_await service.GetCurrentAddress();
            auto devices = co_await service.ListDevices();
        }, detached);
        ioc.run();
*/
class MeshService {
public:
    explicit MeshService(boost::asio::io_context& ioc, ServiceOptions options = {});
    MeshService(boost::asio::io_context& ioc,
                std::shared_ptr<ProcessRunner> runner,
                ServiceOptions options = {});
    ~MeshService() = default;

    MeshService(const MeshService&) = delete;
    MeshService& operator=(const MeshService&) = delete;

    // `ip -4`, e.g. "100.64.1.2". Throws InvalidAddress for anything that is
    // empty or outside the tailnet range.
    boost::asio::awaitable<std::string> GetCurrentAddress();

    boost::asio::awaitable<std::string> GetHostname();

    boost::asio::awaitable<ConnectionStatus> GetStatus();

    // Checks the primary and the fallback binary path, runs nothing
    [[nodiscard]] bool IsAvailable() const;

    // Never throws, any failure reads as "not connected"
    boost::asio::awaitable<bool> IsConnected();

    // Every peer except this device, ordered by id
    boost::asio::awaitable<std::vector<DeviceRecord>> ListDevices();

    [[nodiscard]] const ServiceOptions& options() const { return options_; }

    static std::string ValidateAddress(std::string_view output);
    static ConnectionStatus ProjectStatus(const StatusSnapshot& snapshot);
    static std::vector<DeviceRecord> ProjectDevices(const StatusSnapshot& snapshot);

private:
    ServiceOptions options_;
    std::shared_ptr<ProcessRunner> runner_;
    boost::asio::strand<boost::asio::io_context::executor_type> strand_;

    template<typename T>
    boost::asio::awaitable<T> dispatch(boost::asio::awaitable<T> operation);

    boost::asio::awaitable<std::string> execute(std::vector<std::string> args);
    boost::asio::awaitable<StatusSnapshot> fetchSnapshot();

    boost::asio::awaitable<std::string> currentAddress();
    boost::asio::awaitable<std::string> hostname();
    boost::asio::awaitable<ConnectionStatus> status();
    boost::asio::awaitable<std::vector<DeviceRecord>> devices();
};

} // namespace tailkit::core
