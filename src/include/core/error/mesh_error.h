#pragma once

#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <string_view>

namespace tailkit::core {

enum class ErrorKind {
    kCommandFailed,   // the tool ran and exited non-zero (detail: stderr)
    kExecutionFailed, // the tool could not be spawned (detail: platform error)
    kInvalidAddress,  // `ip -4` printed something that is not a tailnet address
    kInvalidOutput,   // stdout not UTF-8 or not the expected JSON document
    kNotInstalled,    // raised by callers after IsAvailable() returned false
    kNotConnected,    // raised by callers after IsConnected() returned false
};

NLOHMANN_JSON_SERIALIZE_ENUM(ErrorKind,
                             {
                                 {ErrorKind::kCommandFailed, "CommandFailed"},
                                 {ErrorKind::kExecutionFailed, "ExecutionFailed"},
                                 {ErrorKind::kInvalidAddress, "InvalidAddress"},
                                 {ErrorKind::kInvalidOutput, "InvalidOutput"},
                                 {ErrorKind::kNotInstalled, "NotInstalled"},
                                 {ErrorKind::kNotConnected, "NotConnected"},
                             });

std::string_view ToString(ErrorKind kind);

class MeshError : public std::runtime_error {
public:
    MeshError(ErrorKind kind, std::string detail = {});

    static MeshError CommandFailed(std::string message);
    static MeshError ExecutionFailed(std::string message);
    static MeshError InvalidAddress(std::string value);
    static MeshError InvalidOutput(std::string diagnostic = {});
    static MeshError NotInstalled();
    static MeshError NotConnected();

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

    // The associated value: stderr text, platform error, offending address or,
    // for InvalidOutput, a diagnostic that is not part of the description.
    [[nodiscard]] const std::string& detail() const noexcept { return detail_; }

    [[nodiscard]] std::string description() const { return what(); }
    [[nodiscard]] std::string recovery_suggestion() const;

    [[nodiscard]] nlohmann::json ToJson() const;

private:
    ErrorKind kind_;
    std::string detail_;
};

} // namespace tailkit::core
