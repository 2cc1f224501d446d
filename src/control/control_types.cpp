#include "control_types.hpp"
#include "utils/time_utils.hpp"
#include <algorithm>
#include <cctype>

namespace ArbitrageControl {
namespace Control {

namespace {
    std::string to_lower(const std::string& input_value) {
        std::string normalized_value = input_value;
        std::transform(normalized_value.begin(), normalized_value.end(), normalized_value.begin(),
                       [](unsigned char character) { return static_cast<char>(std::tolower(character)); });
        return normalized_value;
    }
}

std::string to_string(DeploymentType deployment_type) {
    switch (deployment_type) {
        case DeploymentType::SYSTEMD:
            return "systemd";
        case DeploymentType::ECS:
            return "ecs";
        case DeploymentType::K8S:
            return "k8s";
        case DeploymentType::DIRECT:
            return "direct";
    }
    return "direct";
}

std::string to_string(ModuleStatus status) {
    switch (status) {
        case ModuleStatus::RUNNING:
            return "running";
        case ModuleStatus::STOPPED:
            return "stopped";
        case ModuleStatus::STARTING:
            return "starting";
        case ModuleStatus::STOPPING:
            return "stopping";
        case ModuleStatus::ERROR:
            return "error";
    }
    return "error";
}

std::string to_string(ModuleHealth health) {
    switch (health) {
        case ModuleHealth::HEALTHY:
            return "healthy";
        case ModuleHealth::UNHEALTHY:
            return "unhealthy";
        case ModuleHealth::UNKNOWN:
            return "unknown";
    }
    return "unknown";
}

ModuleStatus parse_module_status(const std::string& status_value) {
    const std::string normalized_value = to_lower(status_value);
    if (normalized_value == "running") return ModuleStatus::RUNNING;
    if (normalized_value == "stopped") return ModuleStatus::STOPPED;
    if (normalized_value == "starting") return ModuleStatus::STARTING;
    if (normalized_value == "stopping") return ModuleStatus::STOPPING;
    return ModuleStatus::ERROR;
}

ModuleHealth parse_module_health(const std::string& health_value) {
    const std::string normalized_value = to_lower(health_value);
    if (normalized_value == "healthy") return ModuleHealth::HEALTHY;
    if (normalized_value == "unhealthy") return ModuleHealth::UNHEALTHY;
    return ModuleHealth::UNKNOWN;
}

SystemModule make_degraded_module(const std::string& module_name) {
    SystemModule degraded_module;
    degraded_module.name = module_name;
    degraded_module.status = ModuleStatus::ERROR;
    degraded_module.health = ModuleHealth::UNKNOWN;
    return degraded_module;
}

nlohmann::json control_response_to_json(const ControlResponse& response) {
    nlohmann::json response_json = {
        {"success", response.success},
        {"message", response.message}
    };
    if (!response.data.is_null()) {
        response_json["data"] = response.data;
    }
    return response_json;
}

nlohmann::json system_module_to_json(const SystemModule& module) {
    nlohmann::json module_json = {
        {"name", module.name},
        {"status", to_string(module.status)},
        {"health", to_string(module.health)}
    };
    if (module.last_heartbeat_ms) {
        module_json["lastHeartbeat"] = *module.last_heartbeat_ms;
        module_json["lastHeartbeatIso"] = TimeUtils::convert_epoch_milliseconds_to_iso(*module.last_heartbeat_ms);
    }
    if (module.metrics) {
        module_json["metrics"] = {
            {"cpu", module.metrics->cpu},
            {"memory", module.metrics->memory},
            {"requests", module.metrics->requests}
        };
    }
    return module_json;
}

} // namespace Control
} // namespace ArbitrageControl
