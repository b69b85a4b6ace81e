#pragma once

#include <boost/asio/io_context.hpp>
#include <chrono>
#include <core/constant/tailscale.h>
#include <core/process/process_runner.h>
#include <filesystem>

namespace tailkit::core {

// ProcessRunner backed by Boost.Process. The child is spawned directly from
// the argument vector (no shell), stdin is closed, stdout and stderr are read
// concurrently through async pipes.
//
// The awaiting coroutine must run on a strand or a single-threaded
// io_context: pipe reads and the exit notification are joined on its
// executor without further locking.
class SubprocessRunner : public ProcessRunner {
public:
    explicit SubprocessRunner(boost::asio::io_context& ioc,
                              std::chrono::milliseconds timeout = process::kNoTimeout);
    ~SubprocessRunner() override = default;

    boost::asio::awaitable<ProcessResult> Run(std::string program,
                                              std::vector<std::string> args) override;

    // Resolves `program` to an executable file. Names without a directory
    // component are looked up in PATH. Throws std::system_error with
    // no_such_file_or_directory or permission_denied.
    static std::filesystem::path ResolveExecutable(const std::string& program);

private:
    boost::asio::io_context& ioc_;
    std::chrono::milliseconds timeout_;
};

} // namespace tailkit::core
