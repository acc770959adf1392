#include "neighbormap/config_manager.hpp"
#include "neighbormap/device_classifier.hpp"
#include "neighbormap/logger.hpp"
#include "neighbormap/management_interface.hpp"
#include "neighbormap/management_service.hpp"
#include "neighbormap/simulated_transport.hpp"
#include "neighbormap/utils.hpp"

#include <chrono>
#include <iostream>
#include <string>
#include <vector>

namespace {

const char* DEFAULT_CONFIG_PATH = "config/device_type_patterns.conf";

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [-c <config_file>] [-d] [command words...]\n"
              << "Without command words, commands are read from stdin until 'exit' or 'quit'.\n"
              << "The simulated lab answers on 192.168.1.0/24, e.g.:\n"
              << "  " << program << " discover 192.168.1.1 cisco_ios demo demo 3" << std::endl;
}

bool is_failure(const std::string& output) {
    return neighbormap::utils::starts_with(output, "Error:") ||
           neighbormap::utils::starts_with(output, "Discovery failed:");
}

} // namespace

int main(int argc, char* argv[]) {
    std::string config_path = DEFAULT_CONFIG_PATH;
    bool debug = false;
    std::vector<std::string> command_words;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (!command_words.empty()) {
            command_words.push_back(arg);
        } else if (arg == "-c" || arg == "--config") {
            if (i + 1 >= argc) {
                print_usage(argv[0]);
                return 2;
            }
            config_path = argv[++i];
        } else if (arg == "-d" || arg == "--debug") {
            debug = true;
        } else if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else {
            command_words.push_back(arg);
        }
    }

    neighbormap::MapperLogger logger(debug ? neighbormap::LogLevel::DEBUG : neighbormap::LogLevel::INFO);
    logger.info("MAIN", "Starting NeighborMap");

    neighbormap::ConfigManager config;
    config.set_logger(&logger);
    if (!config.load_config(config_path)) {
        logger.warning("MAIN", "Running with built-in defaults; could not load " + config_path);
    }
    for (const std::string& problem : config.validate_config(config.get_current_config_data())) {
        logger.warning("CONFIG", problem);
    }
    if (auto log_file = config.get_string("logging.file"); log_file && !log_file->empty()) {
        if (!logger.open_log_file(*log_file)) {
            logger.warning("MAIN", "Logging to console only");
        }
    }

    neighbormap::DeviceClassifier classifier(logger);
    if (!classifier.load_patterns(config_path)) {
        logger.warning("MAIN", "Device type patterns not loaded from " + config_path + ", using built-in defaults");
    }

    std::chrono::seconds connect_timeout(15);
    if (auto timeout = config.get_parameter_as<int>("transport.connect_timeout_seconds"); timeout && *timeout > 0) {
        connect_timeout = std::chrono::seconds(*timeout);
    }
    neighbormap::SimulatedTransport transport(logger, connect_timeout);
    neighbormap::load_demo_network(transport);

    neighbormap::ManagementInterface management_interface;
    neighbormap::ManagementService management_service(logger, management_interface, classifier, transport, config);
    management_service.register_cli_commands();

    if (!command_words.empty()) {
        std::string output = management_interface.handle_cli_command(neighbormap::utils::join(command_words, " "));
        std::cout << output << std::endl;
        return is_failure(output) ? 1 : 0;
    }

    std::string line;
    std::cout << "neighbormap> " << std::flush;
    while (std::getline(std::cin, line)) {
        std::string command = neighbormap::utils::trim(line);
        if (command == "exit" || command == "quit") {
            break;
        }
        if (!command.empty()) {
            std::cout << management_interface.handle_cli_command(command) << std::endl;
        }
        std::cout << "neighbormap> " << std::flush;
    }
    logger.info("MAIN", "Exiting NeighborMap");
    return 0;
}
