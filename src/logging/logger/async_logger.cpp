#include "async_logger.hpp"
#include "configs/system_config.hpp"
#include "config_loader/config_loader.hpp"
#include "utils/time_utils.hpp"
#include <iostream>
#include <chrono>
#include <thread>
#include <iomanip>
#include <sstream>
#include <fstream>
#include <ctime>
#include <filesystem>

namespace ArbitrageControl {
namespace Logging {

thread_local LoggingContext* thread_local_logging_context_pointer = nullptr;

LoggingContext* get_logging_context() {
    LoggingContext* thread_logging_context_ptr = thread_local_logging_context_pointer;
    if (!thread_logging_context_ptr) {
        throw std::runtime_error("Logging context not initialized for current thread");
    }
    return thread_logging_context_ptr;
}

LoggingContext* try_get_logging_context() {
    return thread_local_logging_context_pointer;
}

void set_logging_context(LoggingContext& context) {
    thread_local_logging_context_pointer = &context;
}

void clear_logging_context() {
    thread_local_logging_context_pointer = nullptr;
}

void set_log_thread_tag(const std::string& thread_tag_value) {
    LoggingContext* thread_logging_context_ptr = get_logging_context();
    thread_logging_context_ptr->set_thread_tag(thread_tag_value);
}

void log_message(const std::string& message, const std::string& log_file_path) {
    try {
        LoggingContext* thread_logging_context_ptr = get_logging_context();

        std::string timestamp_string;
        try {
            timestamp_string = TimeUtils::get_current_human_readable_time();
        } catch (const std::exception& time_exception_error) {
            log_message_to_stderr("ERROR: TimeUtils failed: " + std::string(time_exception_error.what()));
            timestamp_string = "ERROR-TIME";
        }

        std::string thread_tag_string = thread_logging_context_ptr->get_thread_tag();
        std::stringstream log_stream;
        log_stream << timestamp_string << " [" << thread_tag_string << "]   " << message << std::endl;
        std::string log_formatted_string = log_stream.str();

        if (thread_logging_context_ptr->async_logger) {
            try {
                thread_logging_context_ptr->async_logger->enqueue(log_formatted_string);
                return;
            } catch (const std::exception& logger_exception_error) {
                log_message_to_stderr("ERROR: Async logger enqueue failed: " + std::string(logger_exception_error.what()));
            }
        }

        {
            std::lock_guard<std::mutex> console_guard(thread_logging_context_ptr->console_mutex);
            std::clog << log_formatted_string << std::flush;
        }

        if (!log_file_path.empty()) {
            std::ofstream log_file_stream(log_file_path, std::ios::app);
            if (log_file_stream.is_open()) {
                log_file_stream << log_formatted_string;
            } else {
                log_message_to_stderr("ERROR: Failed to open log file: " + log_file_path);
            }
        }
    } catch (const std::exception& critical_exception_error) {
        log_message_to_stderr("CRITICAL ERROR: Logging system failure: " + std::string(critical_exception_error.what()));
        std::cerr << message << std::endl;
    }
}

void log_message_to_stderr(const std::string& error_message) {
    std::cerr << error_message << std::endl;
}

std::string generate_timestamped_log_filename(const std::string& base_filename) {
    std::time_t now = std::time(nullptr);
    std::tm local_tm_buf;
    localtime_r(&now, &local_tm_buf);

    // Split base name and extension
    std::string base_name = base_filename;
    std::string extension = "";

    size_t dot_pos = base_filename.find_last_of('.');
    size_t slash_pos = base_filename.find_last_of('/');
    if (dot_pos != std::string::npos && (slash_pos == std::string::npos || dot_pos > slash_pos)) {
        base_name = base_filename.substr(0, dot_pos);
        extension = base_filename.substr(dot_pos);
    }

    // base_name_DD-HH-MM.extension
    std::stringstream ss;
    ss << base_name << "_" << std::put_time(&local_tm_buf, TimeUtils::LOG_FILENAME) << extension;
    return ss.str();
}

void shutdown_global_logger(AsyncLogger& logger) {
    logger.stop();
}

// AsyncLogger implementation
void AsyncLogger::stop() {
    {
        std::lock_guard<std::mutex> lock(mtx);
        running.store(false);
    }
    cv.notify_all();
}

void AsyncLogger::enqueue(const std::string& formatted_line) {
    {
        std::lock_guard<std::mutex> lock(mtx);
        queue.push(formatted_line);
    }
    cv.notify_one();
}

void AsyncLogger::collect_all_available_messages(std::vector<std::string>& message_buffer) {
    std::unique_lock<std::mutex> lock(mtx);
    while (!queue.empty()) {
        message_buffer.push_back(std::move(queue.front()));
        queue.pop();
    }
}

void AsyncLogger::wait_for_messages(std::vector<std::string>& message_buffer, int poll_interval_ms) {
    std::unique_lock<std::mutex> lock(mtx);
    cv.wait_for(lock, std::chrono::milliseconds(poll_interval_ms), [&]{ return !queue.empty() || !running.load(); });

    while (!queue.empty()) {
        message_buffer.push_back(std::move(queue.front()));
        queue.pop();
    }
}

void AsyncLogger::output_log_line_internal(const std::string& log_line, std::ofstream& log_file) {
    if (console_output) {
        LoggingContext* thread_logging_context_ptr = get_logging_context();
        std::lock_guard<std::mutex> cguard(thread_logging_context_ptr->console_mutex);
        std::clog << log_line << std::flush;
    }

    if (log_file.is_open()) {
        log_file << log_line;
        log_file.flush();
    }
}

void AsyncLogger::flush_message_buffer(std::vector<std::string>& message_buffer, std::ofstream& log_file) {
    for (const auto& log_line : message_buffer) {
        output_log_line_internal(log_line, log_file);
    }
    message_buffer.clear();
}

std::shared_ptr<AsyncLogger> initialize_application_foundation(const ArbitrageControl::Config::SystemConfig& config) {
    LoggingContext* thread_logging_context_ptr = get_logging_context();

    std::string configuration_error_message;
    if (!validate_config(config, configuration_error_message)) {
        log_message_to_stderr("ERROR: Config error: " + configuration_error_message);
        throw std::runtime_error("Configuration validation failed: " + configuration_error_message);
    }

    std::string timestamped_log_filename = generate_timestamped_log_filename(config.logging.log_file);
    std::filesystem::path log_directory = std::filesystem::path(timestamped_log_filename).parent_path();
    if (!log_directory.empty()) {
        std::error_code directory_error;
        std::filesystem::create_directories(log_directory, directory_error);
        if (directory_error) {
            throw std::runtime_error("Failed to create log directory " + log_directory.string() + ": " + directory_error.message());
        }
    }

    auto logger_instance = std::make_shared<AsyncLogger>(timestamped_log_filename, config.logging.console_output);
    logger_instance->running.store(true);

    thread_logging_context_ptr->async_logger = logger_instance;
    set_log_thread_tag("MAIN  ");

    return logger_instance;
}

} // namespace Logging
} // namespace ArbitrageControl
