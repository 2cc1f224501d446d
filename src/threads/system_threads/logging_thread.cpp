/**
 * Logging thread.
 * Drains the async logger queue to the console and the log file until the logger is stopped.
 */
#include "logging_thread.hpp"
#include "logging/logs/logging_thread_logs.hpp"
#include <fstream>
#include <vector>

using namespace ArbitrageControl::Threads;
using namespace ArbitrageControl::Logging;

void LoggingThread::operator()() {
    try {
        setup_logging_thread();
        execute_logging_processing_loop();
    } catch (const std::exception& exception) {
        LoggingThreadLogs::log_thread_exception(exception.what());
    }
    clear_logging_context();
}

void LoggingThread::setup_logging_thread() {
    set_logging_context(*logging_context);
    set_log_thread_tag("LOGGER");
}

void LoggingThread::execute_logging_processing_loop() {
    std::ofstream log_file(logger_ptr->get_file_path(), std::ios::app);
    if (!log_file.is_open()) {
        LoggingThreadLogs::log_log_file_open_failed(logger_ptr->get_file_path());
    }

    std::vector<std::string> message_buffer;
    while (logger_ptr->running.load()) {
        try {
            logger_ptr->wait_for_messages(message_buffer, poll_interval_milliseconds);
            if (!message_buffer.empty()) {
                logger_ptr->flush_message_buffer(message_buffer, log_file);
            }
        } catch (const std::exception& exception) {
            LoggingThreadLogs::log_loop_iteration_exception(exception.what());
            message_buffer.clear();
        }
    }

    // Messages enqueued between the last wait and stop()
    logger_ptr->collect_all_available_messages(message_buffer);
    if (!message_buffer.empty()) {
        logger_ptr->flush_message_buffer(message_buffer, log_file);
    }
}
