#include <iostream>
#include <string>
#include <vector>
#include "peerdrop/core/logger.hpp"
#include "peerdrop/core/config.hpp"
#include "peerdrop/core/cli.hpp"
#include "peerdrop/core/utils.hpp"
#include "peerdrop/core/command_registry.hpp"

int main(int argc, char* argv[]) {
    peerdrop::core::CommandLineParser parser("peerdrop");

    if (!parser.parse(argc, argv)) {
        std::cerr << "Error: " << parser.get_error() << "\n\n";
        parser.print_help();
        return 1;
    }

    peerdrop::core::CommandRegistry command_registry;

    if (parser.has_option("help")) {
        parser.print_help();
        command_registry.print_help();
        return 0;
    }

    if (parser.has_option("version")) {
        parser.print_version();
        return 0;
    }

    auto& config = peerdrop::core::Config::instance();
    config.set_defaults();

    std::string config_file = parser.get_option("config");
    if (peerdrop::core::utils::FileUtils::exists(config_file)) {
        if (!config.load_from_file(config_file)) {
            std::cerr << "Error: cannot read configuration file " << config_file << "\n";
            return 1;
        }
    } else if (parser.has_option("config")) {
        std::cerr << "Error: configuration file " << config_file << " does not exist\n";
        return 1;
    }

    config.apply_environment();

    // Command line wins over the configuration file and the environment
    parser.apply_overrides(config);

    auto log_level = parser.has_option("verbose") ?
        peerdrop::core::LogLevel::Debug :
        peerdrop::core::Logger::parse_level(config.get_string("log.level", "info"));
    peerdrop::core::Logger::initialize(config.get_string("log.file", "peerdrop.log"), log_level);

    LOG_INFO("PeerDrop starting up");
    for (const auto& warning : config.warnings()) {
        LOG_WARN("Ignored configuration line {}", warning);
    }

    auto& args = parser.get_positional_args();
    if (args.empty()) {
        parser.print_help();
        command_registry.print_help();
        peerdrop::core::Logger::shutdown();
        return 0;
    }

    std::string command = args[0];

    auto result = command_registry.execute_command(command, args);

    if (!result.success) {
        std::cerr << "Error: " << result.message << "\n";
        if (command_registry.resolve(command).empty()) {
            command_registry.print_help(std::cerr);
        }
    } else if (!result.message.empty()) {
        std::cout << result.message << "\n";
    }

    peerdrop::core::Logger::shutdown();
    return result.exit_code;
}
