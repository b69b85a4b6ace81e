/*
    config.h
    Application configuration stored as TOML. The library never reads it on
    its own, embedding applications load it and hand the result to
    MeshService through MakeServiceOptions().

    Example usage:
    - Initialize the configuration (loads from file or creates default):
        tailkit::core::InitConfig();
    - Read a setting:
        std::string binary = tailkit::core::settings.binary_path;
    - Write a setting and persist it:
        tailkit::core::settings.command_timeout = std::chrono::seconds(5);
        tailkit::core::SaveConfig();

    File layout:
        [setting]
        binary-path = "/usr/bin/tailscale"
        fallback-binary-path = "/usr/local/bin/tailscale"
        command-timeout-ms = 0
        log-level = "info"
*/

#pragma once

#include <chrono>
#include <core/constant/path.h>
#include <core/service/mesh_service.h>
#include <filesystem>
#include <string>
#include <toml++/toml.h>

namespace tailkit::core {

inline toml::table config;

struct Settings {
    std::string binary_path;
    std::string fallback_binary_path;
    std::chrono::milliseconds command_timeout; // 0 waits forever
    std::string log_level;
};

inline Settings settings;

void InitConfig(const std::filesystem::path& file = path::kConfigFile);

void SaveConfig(const std::filesystem::path& file = path::kConfigFile);

ServiceOptions MakeServiceOptions(const Settings& from);

} // namespace tailkit::core
