#include "startup_logs.hpp"
#include "logging/logger/logging_macros.hpp"

using namespace ArbitrageControl::Logging;

void StartupLogs::log_application_header() {
    log_message("=== ARBITRAGE CONTROL ===", "");
}

void StartupLogs::log_control_configuration(const Config::SystemConfig& config) {
    LOG_THREAD_SECTION_HEADER("CONTROL CONFIGURATION");
    TABLE_HEADER_30("Setting", "Value");
    TABLE_ROW_30("Deployment type", config.control.deployment_type.empty() ? "(unset)" : config.control.deployment_type);
    TABLE_ROW_30("Base URL", config.control.endpoints.base_url);
    TABLE_ROW_30("ECS cluster", config.control.endpoints.ecs_cluster);
    TABLE_ROW_30("K8s namespace", config.control.endpoints.k8s_namespace);
    TABLE_ROW_30("Modules", join_modules(config.control.modules));
    TABLE_ROW_30("Serialize cmds", config.control.serialize_module_commands ? "yes" : "no");
    TABLE_SEPARATOR_30();
    TABLE_ROW_30("HTTP timeout", std::to_string(config.http.timeout_seconds) + "s");
    TABLE_ROW_30("TLS verification", config.http.enable_ssl_verification ? "on" : "off");
    TABLE_ROW_30("API token", mask_token(config.http.api_token));
    TABLE_FOOTER_30();
    LOG_THREAD_SECTION_FOOTER();
}

std::string StartupLogs::join_modules(const std::vector<std::string>& modules) {
    std::string joined;
    for (const auto& module : modules) {
        if (!joined.empty()) joined += ",";
        joined += module;
    }
    return joined.empty() ? "(none)" : joined;
}

std::string StartupLogs::mask_token(const std::string& api_token) {
    if (api_token.empty()) return "(none)";
    if (api_token.size() <= 4) return "****";
    return "****" + api_token.substr(api_token.size() - 4);
}
