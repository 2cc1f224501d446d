#include "k8s_controller.hpp"
#include "logging/logs/control_logs.hpp"
#include <stdexcept>

using ArbitrageControl::Logging::ControlLogs;
using json = nlohmann::json;

namespace ArbitrageControl {
namespace Control {

K8sController::K8sController(const Config::BackendEndpointConfig& endpoint_config, API::HttpClientPtr client)
    : BaseController(endpoint_config, std::move(client)) {}

std::string K8sController::config_map_name(const std::string& module) {
    return resource_name(module) + "-config";
}

ControlResponse K8sController::scale(const std::string& module, int replicas, const std::string& operation) {
    json request_body = {
        {"namespace", endpoints.k8s_namespace},
        {"deployment", resource_name(module)},
        {"replicas", replicas}
    };
    return send_command(API::HttpMethod::POST, "/api/control/k8s/scale", request_body, operation, module);
}

ControlResponse K8sController::start(const std::string& module) {
    return scale(module, 1, "start");
}

ControlResponse K8sController::stop(const std::string& module) {
    return scale(module, 0, "stop");
}

ControlResponse K8sController::restart(const std::string& module) {
    json request_body = {
        {"namespace", endpoints.k8s_namespace},
        {"deployment", resource_name(module)}
    };
    return send_command(API::HttpMethod::POST, "/api/control/k8s/rollout-restart", request_body, "restart", module);
}

SystemModule K8sController::parse_deployment(const json& deployment_json, const std::string& module) {
    if (!deployment_json.is_object()) {
        throw std::runtime_error("deployment description is not an object");
    }

    SystemModule module_status;
    module_status.name = module;

    // Absent readyReplicas is how the API reports zero ready pods
    double ready_replicas = 0;
    if (deployment_json.contains("readyReplicas") && deployment_json["readyReplicas"].is_number()) {
        ready_replicas = deployment_json["readyReplicas"].get<double>();
    }
    module_status.status = ready_replicas > 0 ? ModuleStatus::RUNNING : ModuleStatus::STOPPED;

    module_status.health = ModuleHealth::UNHEALTHY;
    if (deployment_json.contains("conditions") && deployment_json["conditions"].is_array()) {
        for (const auto& condition : deployment_json["conditions"]) {
            if (!condition.is_object() || !condition.contains("type") || !condition["type"].is_string()) {
                continue;
            }
            if (condition["type"].get<std::string>() == "Available") {
                if (condition.contains("status") && condition["status"].is_string()
                    && condition["status"].get<std::string>() == "True") {
                    module_status.health = ModuleHealth::HEALTHY;
                }
                break;
            }
        }
    }

    ModuleMetrics metrics;
    if (deployment_json.contains("metrics") && deployment_json["metrics"].is_object()) {
        const json& metrics_json = deployment_json["metrics"];
        metrics.cpu = metrics_json.value("cpu", 0.0);
        metrics.memory = metrics_json.value("memory", 0.0);
        metrics.requests = metrics_json.value("requests", 0.0);
    }
    module_status.metrics = metrics;
    return module_status;
}

SystemModule K8sController::status(const std::string& module) {
    try {
        std::string path = "/api/control/k8s/deployments/" + url_encode(endpoints.k8s_namespace) + "/" + url_encode(resource_name(module));
        return parse_deployment(fetch_json(path), module);
    } catch (const std::exception& exception_error) {
        ControlLogs::log_status_degraded(get_controller_name(), module, exception_error.what());
        return make_degraded_module(module);
    }
}

std::vector<std::string> K8sController::logs(const std::string& module, int lines) {
    return fetch_logs("/api/control/k8s/logs",
                      {{"namespace", endpoints.k8s_namespace},
                       {"deployment", resource_name(module)},
                       {"lines", std::to_string(normalize_line_count(lines))}},
                      module);
}

ControlResponse K8sController::update_config(const std::string& module, const json& config) {
    json request_body = {
        {"namespace", endpoints.k8s_namespace},
        {"name", config_map_name(module)},
        {"data", config}
    };
    ControlResponse write_response = send_command(API::HttpMethod::PUT, "/api/control/k8s/configmap", request_body,
                                                  "update ConfigMap for", module);
    if (!write_response.success) {
        ControlLogs::log_config_write_failed(get_controller_name(), module, write_response.message);
        return write_response;
    }
    return restart(module);
}

} // namespace Control
} // namespace ArbitrageControl
