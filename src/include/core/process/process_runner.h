#pragma once

#include <utility>  // before asio: boost 1.74 awaitable.hpp uses std::exchange
#include <boost/asio/awaitable.hpp>
#include <string>
#include <vector>

namespace tailkit::core {

struct ProcessResult {
    bool exit_success = false;
    int exit_code = -1;
    std::string std_out;
    std::string std_err;
    bool truncated = false; // either stream hit process::kOutputLimit
};

// Runs a program from an argument vector and captures its output.
//
// Implementations throw std::system_error when the program cannot be started
// (missing binary, not executable, spawn failure, timeout). A program that
// starts and exits non-zero is not an error at this level, it is reported
// through ProcessResult::exit_success.
class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;

    // Arguments are taken by value, the returned awaitable may be started
    // after the caller's temporaries are gone.
    virtual boost::asio::awaitable<ProcessResult> Run(std::string program,
                                                      std::vector<std::string> args)
        = 0;
};

} // namespace tailkit::core
