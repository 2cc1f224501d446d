// main.cpp
#include "cli/command_line.hpp"
#include "system/system_manager.hpp"
#include "logging/logs/system_logs.hpp"
#include <iostream>

using namespace ArbitrageControl;

int main(int argc, char* argv[]) {
    std::vector<std::string> arguments(argv, argv + argc);

    CLI::CommandLineOptions options;
    try {
        options = CLI::parse_command_line(arguments);
    } catch (const CLI::UsageError& usage_error) {
        std::cerr << "arbctl: " << usage_error.what() << "\n" << CLI::usage_text();
        return CLI::EXIT_USAGE_ERROR;
    }

    System::SystemInitializationResult initialization_result;
    try {
        initialization_result = System::initialize(options.config_path);
    } catch (const std::exception& initialization_error) {
        std::cerr << "arbctl: " << initialization_error.what() << std::endl;
        return CLI::EXIT_USAGE_ERROR;
    }

    int exit_code = CLI::EXIT_OPERATION_FAILED;
    try {
        exit_code = CLI::run_command(*initialization_result.control_facade, options,
                                     initialization_result.config.control.modules, std::cout);
    } catch (const std::exception& command_error) {
        Logging::SystemLogs::log_fatal_error(std::string("Command failed: ") + command_error.what());
    }

    try {
        System::shutdown(initialization_result);
    } catch (const std::exception& shutdown_error) {
        std::cerr << "arbctl: shutdown: " << shutdown_error.what() << std::endl;
    }
    Logging::clear_logging_context();
    return exit_code;
}
