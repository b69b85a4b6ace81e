#pragma once

#include <utility>  // before asio: boost 1.74 awaitable.hpp uses std::exchange
#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <core/error/mesh_error.h>
#include <core/model.h>
#include <core/service/mesh_service.h>
#include <ostream>
#include <string>
#include <vector>

namespace tailkit::cli {

class CliManager {
public:
    CliManager(boost::asio::io_context& ioc,
               core::MeshService& service,
               std::ostream& out,
               std::ostream& err,
               bool json_output = false);

    // Runs one command to completion on the io_context. Returns the process
    // exit status: 0 on success, 1 when the command failed.
    int Execute(const std::string& command);

private:
    boost::asio::io_context& ioc_;
    core::MeshService& service_;
    std::ostream& out_;
    std::ostream& err_;
    bool json_output_;

    boost::asio::awaitable<void> dispatch(std::string command);

    boost::asio::awaitable<void> handle_ip();
    boost::asio::awaitable<void> handle_hostname();
    boost::asio::awaitable<void> handle_status();
    boost::asio::awaitable<void> handle_devices();
    boost::asio::awaitable<void> handle_connected();
    bool handle_available();

    void require_installed();

    void print_status(const core::ConnectionStatus& status);
    void print_device_list(const std::vector<core::DeviceRecord>& devices);
    void print_error(const core::MeshError& error);
};

} // namespace tailkit::cli
