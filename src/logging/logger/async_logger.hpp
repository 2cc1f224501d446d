#ifndef ASYNC_LOGGER_HPP
#define ASYNC_LOGGER_HPP

#include <string>
#include <mutex>
#include <condition_variable>
#include <queue>
#include <atomic>
#include <thread>
#include <memory>
#include <unordered_map>
#include <vector>
#include <fstream>
#include "configs/system_config.hpp"

namespace ArbitrageControl {
namespace Logging {

// Named constants
constexpr int LOG_TAG_WIDTH = 6;
static_assert(LOG_TAG_WIDTH > 0, "LOG_TAG_WIDTH must be positive");

class AsyncLogger {
private:
    std::string file_path;
    bool console_output;

    void output_log_line_internal(const std::string& log_line, std::ofstream& log_file);

public:
    std::mutex mtx;
    std::condition_variable cv;
    std::queue<std::string> queue;
    std::atomic<bool> running{false};

    explicit AsyncLogger(const std::string& log_file_path, bool echo_to_console = true)
        : file_path(log_file_path), console_output(echo_to_console) {}

    const std::string& get_file_path() const { return file_path; }
    void enqueue(const std::string& formatted_line);
    void stop();

    // Message processing methods (called by logging thread)
    void collect_all_available_messages(std::vector<std::string>& message_buffer);

    // Waits up to poll_interval_ms for messages, then collects whatever is queued
    void wait_for_messages(std::vector<std::string>& message_buffer, int poll_interval_ms);

    // Write messages to log and clear buffer
    void flush_message_buffer(std::vector<std::string>& message_buffer, std::ofstream& log_file);
};


struct LoggingContext {
    std::shared_ptr<AsyncLogger> async_logger;
    std::mutex console_mutex;
    mutable std::mutex thread_tag_mutex;
    std::unordered_map<std::thread::id, std::string> thread_tags;

    std::string get_thread_tag() const {
        std::lock_guard<std::mutex> thread_tag_lock(thread_tag_mutex);
        std::unordered_map<std::thread::id, std::string>::const_iterator thread_tag_map_iterator = thread_tags.find(std::this_thread::get_id());
        if (thread_tag_map_iterator != thread_tags.end()) {
            return thread_tag_map_iterator->second;
        }
        return "MAIN  ";
    }

    void set_thread_tag(const std::string& tag_value) {
        std::lock_guard<std::mutex> lock(thread_tag_mutex);
        std::string tag_string = tag_value;
        if (tag_string.size() < LOG_TAG_WIDTH) {
            tag_string.append(LOG_TAG_WIDTH - tag_string.size(), ' ');
        }
        if (tag_string.size() > LOG_TAG_WIDTH) {
            tag_string = tag_string.substr(0, LOG_TAG_WIDTH);
        }
        thread_tags[std::this_thread::get_id()] = tag_string;
    }

    void clear_thread_tag() {
        std::lock_guard<std::mutex> lock(thread_tag_mutex);
        thread_tags.erase(std::this_thread::get_id());
    }
};

// Thread-local log tag (6 characters, padded/truncated) to appear in timestamp
void set_log_thread_tag(const std::string& thread_tag_value);

// Main logging function
void log_message(const std::string& message, const std::string& log_file_path);

// Bypasses the queue; for failures of the logging path itself
void log_message_to_stderr(const std::string& error_message);

std::string generate_timestamped_log_filename(const std::string& base_filename);

// Global lifecycle helpers (use context internally)
void shutdown_global_logger(AsyncLogger& logger);

// Application foundation initialization
std::shared_ptr<AsyncLogger> initialize_application_foundation(const ArbitrageControl::Config::SystemConfig& config);

// Context access (validates context exists before returning)
LoggingContext* get_logging_context();
LoggingContext* try_get_logging_context();
void set_logging_context(LoggingContext& context);
void clear_logging_context();

} // namespace Logging
} // namespace ArbitrageControl

#endif // ASYNC_LOGGER_HPP
