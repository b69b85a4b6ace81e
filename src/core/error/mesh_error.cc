#include <core/error/mesh_error.h>
#include <spdlog/fmt/fmt.h>
#include <utility>

namespace tailkit::core {

namespace {

std::string Describe(ErrorKind kind, const std::string& detail) {
    switch (kind) {
    case ErrorKind::kCommandFailed:
        return fmt::format("Tailscale command failed: {}", detail);
    case ErrorKind::kExecutionFailed:
        return fmt::format("Failed to execute Tailscale command: {}", detail);
    case ErrorKind::kInvalidAddress:
        return fmt::format("Invalid Tailscale IP address: {}", detail);
    case ErrorKind::kInvalidOutput:
        return "Invalid output from Tailscale command";
    case ErrorKind::kNotInstalled:
        return "Tailscale is not installed on this system";
    case ErrorKind::kNotConnected:
        return "Tailscale is not connected to a network";
    }
    return "Unknown Tailscale error";
}

} // namespace

std::string_view ToString(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::kCommandFailed:
        return "CommandFailed";
    case ErrorKind::kExecutionFailed:
        return "ExecutionFailed";
    case ErrorKind::kInvalidAddress:
        return "InvalidAddress";
    case ErrorKind::kInvalidOutput:
        return "InvalidOutput";
    case ErrorKind::kNotInstalled:
        return "NotInstalled";
    case ErrorKind::kNotConnected:
        return "NotConnected";
    }
    return "Unknown";
}

MeshError::MeshError(ErrorKind kind, std::string detail)
    : std::runtime_error(Describe(kind, detail))
    , kind_(kind)
    , detail_(std::move(detail)) {}

MeshError MeshError::CommandFailed(std::string message) {
    return MeshError(ErrorKind::kCommandFailed, std::move(message));
}

MeshError MeshError::ExecutionFailed(std::string message) {
    return MeshError(ErrorKind::kExecutionFailed, std::move(message));
}

MeshError MeshError::InvalidAddress(std::string value) {
    return MeshError(ErrorKind::kInvalidAddress, std::move(value));
}

MeshError MeshError::InvalidOutput(std::string diagnostic) {
    return MeshError(ErrorKind::kInvalidOutput, std::move(diagnostic));
}

MeshError MeshError::NotInstalled() {
    return MeshError(ErrorKind::kNotInstalled);
}

MeshError MeshError::NotConnected() {
    return MeshError(ErrorKind::kNotConnected);
}

std::string MeshError::recovery_suggestion() const {
    switch (kind_) {
    case ErrorKind::kCommandFailed:
    case ErrorKind::kExecutionFailed:
        return "Check that Tailscale is running and you are logged in. Run 'tailscale status' in "
               "a terminal.";
    case ErrorKind::kInvalidAddress:
        return "Ensure Tailscale is connected to a network. Run 'tailscale up' to connect.";
    case ErrorKind::kInvalidOutput:
        return "This may be a bug. Please report it with the Tailscale version you're using.";
    case ErrorKind::kNotInstalled:
        return "Install Tailscale from https://tailscale.com/download";
    case ErrorKind::kNotConnected:
        return "Run 'tailscale up' to connect to your Tailscale network";
    }
    return {};
}

nlohmann::json MeshError::ToJson() const {
    nlohmann::json data;
    data["kind"] = kind_;
    data["message"] = description();
    data["suggestion"] = recovery_suggestion();
    if (!detail_.empty()) {
        data["detail"] = detail_;
    }
    return data;
}

} // namespace tailkit::core
