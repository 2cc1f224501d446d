#include "system_logs.hpp"
#include "logging/logger/async_logger.hpp"

using namespace ArbitrageControl::Logging;

void SystemLogs::log_fatal_error(const std::string& error_message) {
    log_message("FATAL: " + error_message, "");
}

void SystemLogs::log_system_shutdown_error(const std::string& error_message) {
    log_message("ERROR: Shutdown: " + error_message, "");
}

void SystemLogs::log_command_complete(const std::string& command, bool all_succeeded) {
    log_message("Command '" + command + "' finished: " + (all_succeeded ? "all operations succeeded" : "one or more operations failed"), "");
}

void SystemLogs::log_shutdown() {
    log_message("Arbitrage control shutting down", "");
}
