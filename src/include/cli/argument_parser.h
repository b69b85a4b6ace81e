#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace tailkit::cli {

struct CliOptions {
    std::optional<std::string> config_path;
    std::optional<std::string> binary_path;
    std::optional<std::string> log_level;
    bool json_output = false;
    bool show_help = false;
    std::optional<std::string> command;
};

class ArgumentParser {
public:
    ArgumentParser(int argc, const char* const argv[]);

    // Throws std::runtime_error on unknown options, missing values, unknown
    // commands or an invalid log level
    CliOptions Parse();

    static void ShowHelp(std::ostream& os);

    static bool IsKnownCommand(std::string_view command);

private:
    int argc_;
    const char* const* argv_;
    int i; // index of the argument being parsed

    void parseOption(const std::string& arg, CliOptions& options);
    void parseCommand(CliOptions& options);
    std::string requireValue(const std::string& option);

    void validateOptions(const CliOptions& options);
};

} // namespace tailkit::cli
