#include "ecs_controller.hpp"
#include "logging/logs/control_logs.hpp"
#include <stdexcept>

using ArbitrageControl::Logging::ControlLogs;
using json = nlohmann::json;

namespace ArbitrageControl {
namespace Control {

EcsController::EcsController(const Config::BackendEndpointConfig& endpoint_config, API::HttpClientPtr client)
    : BaseController(endpoint_config, std::move(client)) {}

ControlResponse EcsController::set_desired_count(const std::string& module, int desired_count, const std::string& operation) {
    json request_body = {
        {"cluster", endpoints.ecs_cluster},
        {"service", resource_name(module)},
        {"desiredCount", desired_count}
    };
    return send_command(API::HttpMethod::PUT, "/api/control/ecs/services", request_body, operation, module);
}

ControlResponse EcsController::start(const std::string& module) {
    return set_desired_count(module, 1, "start");
}

ControlResponse EcsController::stop(const std::string& module) {
    return set_desired_count(module, 0, "stop");
}

ControlResponse EcsController::restart(const std::string& module) {
    json request_body = {
        {"cluster", endpoints.ecs_cluster},
        {"service", resource_name(module)}
    };
    return send_command(API::HttpMethod::POST, "/api/control/ecs/restart", request_body, "restart", module);
}

SystemModule EcsController::parse_service_description(const json& service_json, const std::string& module) {
    if (!service_json.is_object() || !service_json.contains("runningCount") || !service_json["runningCount"].is_number()) {
        throw std::runtime_error("service description has no runningCount");
    }

    SystemModule module_status;
    module_status.name = module;
    module_status.status = service_json["runningCount"].get<double>() > 0 ? ModuleStatus::RUNNING : ModuleStatus::STOPPED;
    module_status.health = service_json.contains("healthStatus") && service_json["healthStatus"].is_string()
        ? parse_module_health(service_json["healthStatus"].get<std::string>()) : ModuleHealth::UNKNOWN;

    ModuleMetrics metrics;
    if (service_json.contains("cpuUtilization") && service_json["cpuUtilization"].is_number()) {
        metrics.cpu = service_json["cpuUtilization"].get<double>();
    }
    if (service_json.contains("memoryUtilization") && service_json["memoryUtilization"].is_number()) {
        metrics.memory = service_json["memoryUtilization"].get<double>();
    }
    module_status.metrics = metrics;
    return module_status;
}

SystemModule EcsController::status(const std::string& module) {
    try {
        std::string path = "/api/control/ecs/services/" + url_encode(endpoints.ecs_cluster) + "/" + url_encode(resource_name(module));
        return parse_service_description(fetch_json(path), module);
    } catch (const std::exception& exception_error) {
        ControlLogs::log_status_degraded(get_controller_name(), module, exception_error.what());
        return make_degraded_module(module);
    }
}

std::vector<std::string> EcsController::logs(const std::string& module, int lines) {
    return fetch_logs("/api/control/ecs/logs",
                      {{"cluster", endpoints.ecs_cluster},
                       {"service", resource_name(module)},
                       {"lines", std::to_string(normalize_line_count(lines))}},
                      module);
}

ControlResponse EcsController::update_config(const std::string& module, const json& config) {
    json request_body = {
        {"cluster", endpoints.ecs_cluster},
        {"service", resource_name(module)},
        {"environment", config}
    };
    ControlResponse response = send_command(API::HttpMethod::POST, "/api/control/ecs/update-task", request_body,
                                            "update ECS task for", module);
    if (!response.success) {
        ControlLogs::log_config_write_failed(get_controller_name(), module, response.message);
    }
    return response;
}

} // namespace Control
} // namespace ArbitrageControl
