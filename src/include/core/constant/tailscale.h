#pragma once

#include <chrono>
#include <cstddef>
#include <string_view>

namespace tailkit::core {

namespace tailscale {

inline constexpr std::string_view kDefaultBinaryPath = "/usr/bin/tailscale";
inline constexpr std::string_view kFallbackBinaryPath = "/usr/local/bin/tailscale";

// Every address handed out by the tailnet lives in 100.64.0.0/10
inline constexpr std::string_view kAddressPrefix = "100.";

inline constexpr std::string_view kIpCommand = "ip";
inline constexpr std::string_view kIpv4Flag = "-4";
inline constexpr std::string_view kStatusCommand = "status";
inline constexpr std::string_view kJsonFlag = "--json";

} // namespace tailscale

namespace process {

// Per stream, stdout and stderr are bounded independently
inline constexpr std::size_t kOutputLimit = 1024 * 1024;
inline constexpr std::size_t kReadChunkSize = 16 * 1024;

inline constexpr std::chrono::milliseconds kNoTimeout{0};

} // namespace process

} // namespace tailkit::core
