#pragma once

#include <cstdlib>
#include <filesystem>

namespace tailkit::core {
namespace path {

inline const std::filesystem::path kHomeDir = []() -> std::filesystem::path {
#if defined(_WIN32) || defined(_WIN64)
    const char* home = std::getenv("USERPROFILE");
#else
    const char* home = std::getenv("HOME");
#endif
    return home ? std::filesystem::path(home) : std::filesystem::current_path();
}();

inline const std::filesystem::path kLogDir = std::filesystem::temp_directory_path() / "tailkit"
                                             / "logs";

inline const std::filesystem::path kConfigDir =
#if defined(_WIN32) || defined(_WIN64)
    kHomeDir / "AppData" / "Roaming" / "tailkit";
#elif defined(__APPLE__)
    kHomeDir / "Library" / "Application Support" / "tailkit";
#else
    kHomeDir / ".config" / "tailkit";
#endif

inline const std::filesystem::path kConfigFile = kConfigDir / "config.toml";

} // namespace path
} // namespace tailkit::core
