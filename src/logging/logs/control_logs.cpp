#include "control_logs.hpp"
#include "logging/logger/async_logger.hpp"

using namespace ArbitrageControl::Logging;

void ControlLogs::log_backend_selected(const std::string& deployment_type, const std::string& controller_name, const std::string& base_url) {
    log_message("CONTROL_BACKEND: Using " + deployment_type + " deployment via " + controller_name + " at " + base_url, "");
}

void ControlLogs::log_unrecognized_deployment_type(const std::string& raw_value) {
    log_message("WARNING: Unrecognized deployment type '" + raw_value + "' - falling back to direct process control", "");
}

void ControlLogs::log_operation(const std::string& verb, const std::string& module, const std::string& deployment_type) {
    log_message(verb + " module " + module + " using " + deployment_type + " controller", "");
}

void ControlLogs::log_operation_result(const std::string& verb, const std::string& module, const Control::ControlResponse& response) {
    if (response.success) {
        log_message(verb + " " + module + ": OK" + (response.message.empty() ? "" : " - " + response.message), "");
    } else {
        log_message("ERROR: " + verb + " " + module + " failed: " + response.message, "");
    }
}

void ControlLogs::log_batch_summary(const std::string& verb, int total_count, int success_count, const std::string& deployment_type) {
    log_message("BATCH " + verb + ": " + std::to_string(success_count) + "/" + std::to_string(total_count) +
                " modules succeeded (" + deployment_type + ")", "");
}

void ControlLogs::log_transport_failure(const std::string& controller_name, const std::string& operation, const std::string& module, const std::string& error_message) {
    log_message("ERROR: " + controller_name + " " + operation + " " + module + " transport failure: " + error_message, "");
}

void ControlLogs::log_status_degraded(const std::string& controller_name, const std::string& module, const std::string& reason) {
    log_message("WARNING: " + controller_name + " status for " + module + " degraded to error/unknown: " + reason, "");
}

void ControlLogs::log_logs_fetch_failed(const std::string& controller_name, const std::string& module, const std::string& reason) {
    log_message("WARNING: " + controller_name + " could not fetch logs for " + module + ": " + reason, "");
}

void ControlLogs::log_config_write_failed(const std::string& controller_name, const std::string& module, const std::string& message) {
    log_message("ERROR: " + controller_name + " config write for " + module + " failed: " + message, "");
}

void ControlLogs::log_heartbeat_ignored(const std::string& reason) {
    log_message("WARNING: ignoring unreadable heartbeat: " + reason, "");
}

void ControlLogs::log_direct_restart_delay(const std::string& module, int delay_ms) {
    log_message("Direct restart " + module + ": waiting " + std::to_string(delay_ms) + "ms for process to release its port", "");
}

void ControlLogs::log_direct_module_alias(const std::string& module) {
    log_message("NOTE: Direct process control manages a single process - module '" + module + "' addresses the whole system", "");
}
