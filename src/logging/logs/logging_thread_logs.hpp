#ifndef LOGGING_THREAD_LOGS_HPP
#define LOGGING_THREAD_LOGS_HPP

#include <string>

namespace ArbitrageControl {
namespace Logging {

// Written straight to stderr: the queue these would go through is the one that failed
class LoggingThreadLogs {
public:
    static void log_thread_exception(const std::string& error_message);
    static void log_loop_iteration_exception(const std::string& error_message);
    static void log_log_file_open_failed(const std::string& log_file_path);
};

} // namespace Logging
} // namespace ArbitrageControl

#endif // LOGGING_THREAD_LOGS_HPP
