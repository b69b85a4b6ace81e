#include <array>
#include <utility>  // before asio: boost 1.74 awaitable.hpp uses std::exchange
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/process/args.hpp>
#include <boost/process/async.hpp>
#include <boost/process/async_pipe.hpp>
#include <boost/process/child.hpp>
#include <boost/process/exe.hpp>
#include <boost/process/io.hpp>
#include <boost/process/search_path.hpp>
#include <core/process/subprocess_runner.h>
#include <core/util/text.h>
#include <memory>
#include <spdlog/spdlog.h>
#include <system_error>

namespace net = boost::asio;
namespace bp = boost::process;

namespace tailkit::core {

namespace {

// Joins the completions belonging to one child (stdout EOF, stderr EOF, exit)
// on a single executor. The timer doubles as the optional deadline.
class CompletionLatch {
public:
    CompletionLatch(const net::any_io_executor& executor, std::size_t count)
        : timer_(executor, net::steady_timer::time_point::max())
        , count_(count) {}

    void CountDown() {
        if (count_ > 0 && --count_ == 0) {
            timer_.cancel();
        }
    }

    [[nodiscard]] bool Done() const { return count_ == 0; }

    // Returns false when the deadline passed before every completion arrived
    net::awaitable<bool> Wait(std::chrono::milliseconds timeout) {
        if (timeout > std::chrono::milliseconds::zero()) {
            timer_.expires_after(timeout);
        }
        while (!Done()) {
            boost::system::error_code ec;
            co_await timer_.async_wait(net::redirect_error(net::use_awaitable, ec));
            if (!ec) {
                co_return Done();
            }
        }
        co_return true;
    }

private:
    net::steady_timer timer_;
    std::size_t count_;
};

struct CapturedStream {
    explicit CapturedStream(net::io_context& ioc)
        : pipe(ioc) {}

    bp::async_pipe pipe;
    std::string data;
    bool truncated = false;
};

struct ChildState {
    ChildState(net::io_context& ioc, const net::any_io_executor& executor)
        : out(ioc)
        , err(ioc)
        , latch(executor, 3) {}

    bp::child child;
    CapturedStream out;
    CapturedStream err;
    CompletionLatch latch;
    int exit_code = -1;
    std::error_code exit_error;
};

// Reads until EOF. Anything past the limit is read and dropped so the child
// never blocks on a full pipe.
net::awaitable<void> Drain(std::shared_ptr<ChildState> state, CapturedStream& stream) {
    std::array<char, process::kReadChunkSize> chunk{};
    for (;;) {
        boost::system::error_code ec;
        std::size_t n = co_await stream.pipe.async_read_some(net::buffer(chunk),
                                                             net::redirect_error(net::use_awaitable,
                                                                                 ec));
        std::size_t room = process::kOutputLimit - stream.data.size();
        if (n > room) {
            stream.truncated = true;
            n = room;
        }
        stream.data.append(chunk.data(), n);

        if (ec) {
            if (ec != net::error::eof) {
                spdlog::debug("Pipe read stopped: {}", ec.message());
            }
            co_return;
        }
    }
}

void SpawnDrain(const net::any_io_executor& executor,
                const std::shared_ptr<ChildState>& state,
                CapturedStream& stream) {
    net::co_spawn(executor, Drain(state, stream), [state](std::exception_ptr e) {
        if (e) {
            try {
                std::rethrow_exception(e);
            } catch (const std::exception& ex) {
                spdlog::error("Reading child output failed: {}", ex.what());
            }
        }
        state->latch.CountDown();
    });
}

} // namespace

SubprocessRunner::SubprocessRunner(net::io_context& ioc, std::chrono::milliseconds timeout)
    : ioc_(ioc)
    , timeout_(timeout) {}

std::filesystem::path SubprocessRunner::ResolveExecutable(const std::string& program) {
    std::filesystem::path candidate(program);
    if (!candidate.has_parent_path()) {
        auto found = program.empty() ? boost::filesystem::path{} : bp::search_path(program);
        if (found.empty()) {
            throw std::system_error(std::make_error_code(std::errc::no_such_file_or_directory),
                                    "'" + program + "' not found in PATH");
        }
        candidate = found.string();
    }

    std::error_code ec;
    auto status = std::filesystem::status(candidate, ec);
    if (ec || !std::filesystem::is_regular_file(status)) {
        throw std::system_error(std::make_error_code(std::errc::no_such_file_or_directory),
                                candidate.string() + " does not exist");
    }

    using perms = std::filesystem::perms;
    if ((status.permissions() & (perms::owner_exec | perms::group_exec | perms::others_exec))
        == perms::none) {
        throw std::system_error(std::make_error_code(std::errc::permission_denied),
                                candidate.string() + " is not executable");
    }
    return candidate;
}

net::awaitable<ProcessResult> SubprocessRunner::Run(std::string program,
                                                    std::vector<std::string> args) {
    auto executable = ResolveExecutable(program);
    spdlog::debug("Executing command: {}", text::JoinCommandLine(executable.string(), args));

    auto executor = co_await net::this_coro::executor;
    auto state = std::make_shared<ChildState>(ioc_, executor);

    std::error_code spawn_error;
    state->child = bp::child(
        bp::exe = executable.string(),
        bp::args = args,
        bp::std_in.close(),
        bp::std_out > state->out.pipe,
        bp::std_err > state->err.pipe,
        bp::on_exit([state, executor](int exit_code, const std::error_code& ec) {
            net::post(executor, [state, exit_code, ec]() {
                state->exit_code = exit_code;
                state->exit_error = ec;
                state->latch.CountDown();
            });
        }),
        ioc_,
        spawn_error);
    if (spawn_error) {
        spdlog::error("Failed to spawn {}: {}", executable.string(), spawn_error.message());
        throw std::system_error(spawn_error, "failed to spawn " + executable.string());
    }

    SpawnDrain(executor, state, state->out);
    SpawnDrain(executor, state, state->err);

    if (!co_await state->latch.Wait(timeout_)) {
        spdlog::error("{} did not finish within {} ms, terminating",
                      executable.string(),
                      timeout_.count());
        std::error_code ec;
        state->child.terminate(ec);
        throw std::system_error(std::make_error_code(std::errc::timed_out),
                                executable.string() + " timed out");
    }

    ProcessResult result;
    result.exit_code = state->exit_code;
    result.exit_success = !state->exit_error && state->exit_code == 0;
    result.std_out = std::move(state->out.data);
    result.std_err = std::move(state->err.data);
    result.truncated = state->out.truncated || state->err.truncated;

    if (result.truncated) {
        spdlog::warn("Output of {} exceeded {} bytes and was truncated",
                     executable.string(),
                     process::kOutputLimit);
    }
    co_return result;
}

} // namespace tailkit::core
