#ifndef CONTROL_TYPES_HPP
#define CONTROL_TYPES_HPP

#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace ArbitrageControl {
namespace Control {

enum class DeploymentType {
    SYSTEMD,
    ECS,
    K8S,
    DIRECT
};

enum class ModuleStatus {
    RUNNING,
    STOPPED,
    STARTING,
    STOPPING,
    ERROR
};

enum class ModuleHealth {
    HEALTHY,
    UNHEALTHY,
    UNKNOWN
};

struct ModuleMetrics {
    double cpu{0.0};
    double memory{0.0};
    double requests{0.0};
};

/**
 * Point-in-time snapshot of one module as reported by the active backend.
 * Created fresh per status() call; never cached by the control layer.
 */
struct SystemModule {
    std::string name;
    ModuleStatus status{ModuleStatus::ERROR};
    ModuleHealth health{ModuleHealth::UNKNOWN};
    std::optional<std::int64_t> last_heartbeat_ms;
    std::optional<ModuleMetrics> metrics;
};

// Universal success/failure envelope of every mutating operation
struct ControlResponse {
    bool success{false};
    std::string message;
    nlohmann::json data; // null when the backend sent none

    static ControlResponse failure(const std::string& failure_message) {
        return ControlResponse{false, failure_message, nullptr};
    }
};

std::string to_string(DeploymentType deployment_type);
std::string to_string(ModuleStatus status);
std::string to_string(ModuleHealth health);

// Unrecognized values map to ERROR / UNKNOWN; matching is case-insensitive
ModuleStatus parse_module_status(const std::string& status_value);
ModuleHealth parse_module_health(const std::string& health_value);

// status=error, health=unknown: the answer whenever a backend cannot be read
SystemModule make_degraded_module(const std::string& module_name);

nlohmann::json control_response_to_json(const ControlResponse& response);
nlohmann::json system_module_to_json(const SystemModule& module);

} // namespace Control
} // namespace ArbitrageControl

#endif // CONTROL_TYPES_HPP
