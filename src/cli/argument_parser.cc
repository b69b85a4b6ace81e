#include <algorithm>
#include <array>
#include <cctype>
#include <cli/argument_parser.h>
#include <stdexcept>

namespace tailkit::cli {

namespace {

constexpr std::array<std::string_view, 6> kCommands = {
    "ip", "hostname", "status", "devices", "available", "connected",
};

} // namespace

ArgumentParser::ArgumentParser(int argc, const char* const argv[])
    : argc_(argc)
    , argv_(argv)
    , i(1) {}

CliOptions ArgumentParser::Parse() {
    CliOptions options;

    while (i < argc_) {
        std::string arg = argv_[i];

        if (arg.empty() || arg[0] != '-') {
            parseCommand(options);
            break;
        }

        parseOption(arg, options);
        i++;
    }

    validateOptions(options);
    return options;
}

bool ArgumentParser::IsKnownCommand(std::string_view command) {
    return std::find(kCommands.begin(), kCommands.end(), command) != kCommands.end();
}

void ArgumentParser::parseOption(const std::string& arg, CliOptions& options) {
    if (arg == "-c" || arg == "--config") {
        options.config_path = requireValue("config path");
    } else if (arg == "-b" || arg == "--binary") {
        options.binary_path = requireValue("binary path");
    } else if (arg == "-l" || arg == "--log-level") {
        auto level = requireValue("log level");
        std::transform(level.begin(), level.end(), level.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        options.log_level = level;
    } else if (arg == "-j" || arg == "--json") {
        options.json_output = true;
    } else if (arg == "-h" || arg == "--help") {
        options.show_help = true;
    } else {
        throw std::runtime_error("Unknown option: " + arg);
    }
}

std::string ArgumentParser::requireValue(const std::string& what) {
    if (++i >= argc_) {
        throw std::runtime_error("Missing " + what);
    }
    return argv_[i];
}

void ArgumentParser::parseCommand(CliOptions& options) {
    if (i >= argc_) {
        return;
    }

    options.command = argv_[i++];
    if (i < argc_) {
        throw std::runtime_error("Unexpected argument: " + std::string(argv_[i]));
    }
}

void ArgumentParser::validateOptions(const CliOptions& options) {
    if (options.command && !IsKnownCommand(*options.command)) {
        throw std::runtime_error("Unknown command: " + *options.command);
    }

    if (options.log_level) {
        const auto& level = *options.log_level;
        if (level != "debug" && level != "info" && level != "warning" && level != "error") {
            throw std::runtime_error("Invalid log level: " + *options.log_level);
        }
    }
}

void ArgumentParser::ShowHelp(std::ostream& os) {
    os << "Usage: tailkit [options] <command>\n\n"
       << "Options:\n"
       << "  -c, --config PATH    Set config file path\n"
       << "  -b, --binary PATH    Path to the tailscale binary\n"
       << "  -l, --log-level LVL  Set log level (debug|info|warning|error)\n"
       << "  -j, --json           Print results as JSON\n"
       << "  -h, --help           Show this help message\n\n"
       << "Commands:\n"
       << "  ip                   Print this device's tailnet IPv4 address\n"
       << "  hostname             Print this device's tailnet hostname\n"
       << "  status               Show connection status\n"
       << "  devices              List the other devices in the tailnet\n"
       << "  available            Check whether the tailscale binary is installed\n"
       << "  connected            Check whether this device is online in the tailnet\n";
}

} // namespace tailkit::cli
