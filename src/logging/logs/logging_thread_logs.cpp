#include "logging_thread_logs.hpp"
#include "logging/logger/async_logger.hpp"

using namespace ArbitrageControl::Logging;

void LoggingThreadLogs::log_thread_exception(const std::string& error_message) {
    log_message_to_stderr("LoggingThread exception: " + error_message);
}

void LoggingThreadLogs::log_loop_iteration_exception(const std::string& error_message) {
    log_message_to_stderr("LoggingThread loop iteration exception: " + error_message);
}

void LoggingThreadLogs::log_log_file_open_failed(const std::string& log_file_path) {
    log_message_to_stderr("LoggingThread could not open " + log_file_path + " - console output only");
}
