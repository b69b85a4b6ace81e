#include <core/util/config.h>
#include <fstream>
#include <spdlog/spdlog.h>

namespace tailkit::core {

static void LoadSetting() {
    if (!config["setting"].is_table()) {
        config.insert_or_assign("setting", toml::table{});
    }
    auto& setting = *config["setting"].as_table();

    settings.binary_path = setting["binary-path"].value_or(
        std::string(tailscale::kDefaultBinaryPath));
    settings.fallback_binary_path = setting["fallback-binary-path"].value_or(
        std::string(tailscale::kFallbackBinaryPath));

    auto timeout_ms = setting["command-timeout-ms"].value_or(int64_t{0});
    if (timeout_ms < 0) {
        spdlog::warn("Ignoring negative command-timeout-ms ({})", timeout_ms);
        timeout_ms = 0;
    }
    settings.command_timeout = std::chrono::milliseconds(timeout_ms);

    settings.log_level = setting["log-level"].value_or(std::string("info"));
}

void InitConfig(const std::filesystem::path& file) {
    std::error_code ec;
    if (file.has_parent_path() && !std::filesystem::exists(file.parent_path(), ec)) {
        spdlog::info("Config directory does not exist, creating...");
        std::filesystem::create_directories(file.parent_path(), ec);
        if (ec) {
            spdlog::error("Failed to create \"{}\": {}", file.parent_path().string(), ec.message());
        }
    }
    if (!std::filesystem::exists(file, ec)) {
        std::ofstream ofs(file);
        spdlog::info("Config file does not exist, creating...");
    }
    try {
        config = toml::parse_file(file.string());
    } catch (const toml::parse_error& err) {
        spdlog::error("\"{}\" could not be parsed: {}", file.string(), err.description());
        config = toml::table{};
    }

    LoadSetting();
}

void SaveConfig(const std::filesystem::path& file) {
    std::ofstream ofs(file);
    if (!ofs.is_open()) {
        spdlog::error("Failed to open \"{}\" for saving config.", file.string());
        return;
    }
    config.insert_or_assign("setting",
                            toml::table{
                                {"binary-path", settings.binary_path},
                                {"fallback-binary-path", settings.fallback_binary_path},
                                {"command-timeout-ms",
                                 static_cast<int64_t>(settings.command_timeout.count())},
                                {"log-level", settings.log_level},
                            });
    ofs << config;
}

ServiceOptions MakeServiceOptions(const Settings& from) {
    return ServiceOptions{
        .binary_path = from.binary_path,
        .fallback_binary_path = from.fallback_binary_path,
        .command_timeout = from.command_timeout,
    };
}

} // namespace tailkit::core
