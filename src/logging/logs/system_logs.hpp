#ifndef SYSTEM_LOGS_HPP
#define SYSTEM_LOGS_HPP

#include <string>

namespace ArbitrageControl {
namespace Logging {

/**
 * Specialized logging for system management operations.
 */
class SystemLogs {
public:
    static void log_fatal_error(const std::string& error_message);
    static void log_system_shutdown_error(const std::string& error_message);
    static void log_command_complete(const std::string& command, bool all_succeeded);
    static void log_shutdown();
};

} // namespace Logging
} // namespace ArbitrageControl

#endif // SYSTEM_LOGS_HPP
