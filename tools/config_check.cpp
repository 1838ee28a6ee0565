/**
 * rme_config_check - validate an engine configuration file
 */
#include "../include/config/config_loader.hpp"
#include "../include/util/cli.hpp"

#include <iostream>

int main(int argc, char* argv[]) {
    rme::util::CLIArgs args;
    if (!rme::util::parse_args(argc, argv, args))
        return 2;

    if (args.help) {
        rme::util::print_help();
        return 0;
    }

    if (args.defaults) {
        auto cfg = rme::config::EngineConfig::defaults();
        std::cout << rme::config::ConfigLoader::dump(cfg) << "\n";
        return 0;
    }

    if (args.config_path.empty()) {
        std::cerr << "Missing config file.\n";
        std::cerr << "Use --help for usage information.\n";
        return 2;
    }

    try {
        auto cfg = rme::config::ConfigLoader::load(args.config_path);
        if (!args.quiet) {
            std::cout << "[ " << args.config_path << " ] valid\n";
            std::cout << rme::config::ConfigLoader::dump(cfg) << "\n";
        }
    } catch (const rme::config::ConfigError& e) {
        std::cerr << "Invalid configuration: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
