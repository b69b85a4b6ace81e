#include <boost/asio/io_context.hpp>
#include <cli/argument_parser.h>
#include <cli/cli_manager.h>
#include <core/constant/path.h>
#include <core/service/mesh_service.h>
#include <core/util/config.h>
#include <core/util/logger.h>
#include <iostream>

using namespace tailkit;
using namespace tailkit::core;
namespace net = boost::asio;

int main(int argc, char* argv[]) {
    cli::CliOptions options;
    try {
        options = cli::ArgumentParser(argc, argv).Parse();
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n\n";
        cli::ArgumentParser::ShowHelp(std::cerr);
        return 2;
    }
    if (options.show_help) {
        cli::ArgumentParser::ShowHelp(std::cout);
        return 0;
    }
    if (!options.command) {
        cli::ArgumentParser::ShowHelp(std::cerr);
        return 2;
    }

    Logger logger(
#ifdef TAILKIT_DEBUG
        Logger::Level::debug,
#else
        Logger::Level::info,
#endif
        path::kLogDir);

    InitConfig(options.config_path ? std::filesystem::path(*options.config_path)
                                   : path::kConfigFile);
    logger.set_log_level(Logger::ParseLevel(options.log_level.value_or(settings.log_level)));
    if (options.binary_path) {
        settings.binary_path = *options.binary_path;
    }

    net::io_context ioc;
    MeshService service(ioc, MakeServiceOptions(settings));
    cli::CliManager manager(ioc, service, std::cout, std::cerr, options.json_output);

    return manager.Execute(*options.command);
}
