#include <core/decode/status_decoder.h>
#include <core/error/error_classifier.h>
#include <core/util/text.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <system_error>

namespace tailkit::core {

std::string TakeOutput(ProcessResult&& result) {
    if (!result.exit_success) {
        std::string message(text::Trim(result.std_err));
        if (message.empty()) {
            message = "Unknown error";
        }
        spdlog::error("Tailscale command failed with exit code {}: {}", result.exit_code, message);
        throw MeshError::CommandFailed(std::move(message));
    }
    if (!text::IsValidUtf8(result.std_out)) {
        throw MeshError::InvalidOutput("stdout is not valid UTF-8");
    }
    return std::move(result.std_out);
}

MeshError Classify(std::exception_ptr error) {
    try {
        std::rethrow_exception(error);
    } catch (const MeshError& e) {
        return e;
    } catch (const DecodeError& e) {
        spdlog::error("Unexpected status document: {}", e.what());
        return MeshError::InvalidOutput(e.what());
    } catch (const nlohmann::json::exception& e) {
        spdlog::error("Unexpected status document: {}", e.what());
        return MeshError::InvalidOutput(e.what());
    } catch (const std::system_error& e) {
        spdlog::error("Failed to execute Tailscale command: {}", e.what());
        return MeshError::ExecutionFailed(e.what());
    } catch (const std::exception& e) {
        spdlog::error("Failed to execute Tailscale command: {}", e.what());
        return MeshError::ExecutionFailed(e.what());
    } catch (...) {
        spdlog::error("Failed to execute Tailscale command: unknown exception");
        return MeshError::ExecutionFailed("unknown exception");
    }
}

} // namespace tailkit::core
