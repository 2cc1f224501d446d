#ifndef STARTUP_LOGS_HPP
#define STARTUP_LOGS_HPP

#include "configs/system_config.hpp"

namespace ArbitrageControl {
namespace Logging {

/**
 * Startup banner and effective configuration table.
 */
class StartupLogs {
public:
    static void log_application_header();
    static void log_control_configuration(const Config::SystemConfig& config);

private:
    static std::string join_modules(const std::vector<std::string>& modules);
    static std::string mask_token(const std::string& api_token);
};

} // namespace Logging
} // namespace ArbitrageControl

#endif // STARTUP_LOGS_HPP
