#ifndef CONTROL_LOGS_HPP
#define CONTROL_LOGS_HPP

#include "control/control_types.hpp"
#include <string>

namespace ArbitrageControl {
namespace Logging {

/**
 * Control operation logging.
 * Every line carries the active deployment type or controller so that logs from
 * heterogeneous environments can be told apart.
 */
class ControlLogs {
public:
    // Facade lifecycle
    static void log_backend_selected(const std::string& deployment_type, const std::string& controller_name, const std::string& base_url);
    static void log_unrecognized_deployment_type(const std::string& raw_value);

    // Per-operation
    static void log_operation(const std::string& verb, const std::string& module, const std::string& deployment_type);
    static void log_operation_result(const std::string& verb, const std::string& module, const Control::ControlResponse& response);
    static void log_batch_summary(const std::string& verb, int total_count, int success_count, const std::string& deployment_type);

    // Adapter failures
    static void log_transport_failure(const std::string& controller_name, const std::string& operation, const std::string& module, const std::string& error_message);
    static void log_status_degraded(const std::string& controller_name, const std::string& module, const std::string& reason);
    static void log_logs_fetch_failed(const std::string& controller_name, const std::string& module, const std::string& reason);
    static void log_config_write_failed(const std::string& controller_name, const std::string& module, const std::string& message);
    static void log_heartbeat_ignored(const std::string& reason);

    // Direct controller specifics
    static void log_direct_restart_delay(const std::string& module, int delay_ms);
    static void log_direct_module_alias(const std::string& module);
};

} // namespace Logging
} // namespace ArbitrageControl

#endif // CONTROL_LOGS_HPP
