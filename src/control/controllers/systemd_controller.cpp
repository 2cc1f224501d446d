#include "systemd_controller.hpp"
#include "logging/logs/control_logs.hpp"
#include "utils/time_utils.hpp"
#include <cmath>
#include <cstdint>
#include <limits>
#include <stdexcept>

using ArbitrageControl::Logging::ControlLogs;
using json = nlohmann::json;

namespace ArbitrageControl {
namespace Control {

SystemdController::SystemdController(const Config::BackendEndpointConfig& endpoint_config, API::HttpClientPtr client)
    : BaseController(endpoint_config, std::move(client)) {}

std::string SystemdController::unit_name(const std::string& module) {
    return resource_name(module) + ".service";
}

ControlResponse SystemdController::start(const std::string& module) {
    return send_command(API::HttpMethod::POST, "/api/control/systemd/start",
                        json{{"service", unit_name(module)}}, "start", module);
}

ControlResponse SystemdController::stop(const std::string& module) {
    return send_command(API::HttpMethod::POST, "/api/control/systemd/stop",
                        json{{"service", unit_name(module)}}, "stop", module);
}

ControlResponse SystemdController::restart(const std::string& module) {
    return send_command(API::HttpMethod::POST, "/api/control/systemd/restart",
                        json{{"service", unit_name(module)}}, "restart", module);
}

// An unreadable heartbeat is dropped; it never fails the snapshot
std::optional<std::int64_t> SystemdController::parse_heartbeat(const json& heartbeat_value) {
    if (heartbeat_value.is_number_unsigned()) {
        std::uint64_t heartbeat_ms = heartbeat_value.get<std::uint64_t>();
        if (heartbeat_ms > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            return std::nullopt;
        }
        return static_cast<std::int64_t>(heartbeat_ms);
    }
    if (heartbeat_value.is_number_integer()) {
        return heartbeat_value.get<std::int64_t>();
    }
    if (heartbeat_value.is_number_float()) {
        double heartbeat_ms = heartbeat_value.get<double>();
        if (!std::isfinite(heartbeat_ms) || heartbeat_ms < static_cast<double>(std::numeric_limits<std::int64_t>::min())
            || heartbeat_ms >= static_cast<double>(std::numeric_limits<std::int64_t>::max())) {
            return std::nullopt;
        }
        return static_cast<std::int64_t>(heartbeat_ms);
    }
    if (heartbeat_value.is_string()) {
        try {
            return TimeUtils::parse_iso_time_to_epoch_milliseconds(heartbeat_value.get<std::string>());
        } catch (const std::runtime_error& parse_error) {
            ControlLogs::log_heartbeat_ignored(parse_error.what());
        }
    }
    return std::nullopt;
}

SystemModule SystemdController::parse_status_payload(const json& payload_data, const std::string& module) {
    if (!payload_data.is_object()) {
        throw std::runtime_error("status payload has no data object");
    }

    SystemModule module_status;
    module_status.name = payload_data.contains("name") && payload_data["name"].is_string()
        ? payload_data["name"].get<std::string>() : module;
    module_status.status = payload_data.contains("status") && payload_data["status"].is_string()
        ? parse_module_status(payload_data["status"].get<std::string>()) : ModuleStatus::ERROR;
    module_status.health = payload_data.contains("health") && payload_data["health"].is_string()
        ? parse_module_health(payload_data["health"].get<std::string>()) : ModuleHealth::UNKNOWN;

    if (payload_data.contains("lastHeartbeat")) {
        module_status.last_heartbeat_ms = parse_heartbeat(payload_data["lastHeartbeat"]);
    }

    if (payload_data.contains("metrics") && payload_data["metrics"].is_object()) {
        const json& metrics_json = payload_data["metrics"];
        ModuleMetrics metrics;
        metrics.cpu = metrics_json.value("cpu", 0.0);
        metrics.memory = metrics_json.value("memory", 0.0);
        metrics.requests = metrics_json.value("requests", 0.0);
        module_status.metrics = metrics;
    }
    return module_status;
}

SystemModule SystemdController::status(const std::string& module) {
    try {
        json response_json = fetch_json("/api/control/systemd/status");
        if (!response_json.is_object() || !response_json.contains("data")) {
            throw std::runtime_error("status payload has no data object");
        }
        return parse_status_payload(response_json["data"], module);
    } catch (const std::exception& exception_error) {
        ControlLogs::log_status_degraded(get_controller_name(), module, exception_error.what());
        return make_degraded_module(module);
    }
}

std::vector<std::string> SystemdController::logs(const std::string& module, int lines) {
    return fetch_logs("/api/control/systemd/logs",
                      {{"service", unit_name(module)}, {"lines", std::to_string(normalize_line_count(lines))}},
                      module);
}

ControlResponse SystemdController::update_config(const std::string& module, const json& config) {
    bool transport_failed = false;
    ControlResponse write_response = send_command(API::HttpMethod::POST, "/api/config/update",
                                                  json{{"module", module}, {"config", config}},
                                                  "update config for", module, &transport_failed);
    if (write_response.success) {
        return restart(module);
    }

    ControlLogs::log_config_write_failed(get_controller_name(), module, write_response.message);
    // Only an unreachable gateway aborts; a rejected write still restarts the unit
    if (transport_failed) {
        return write_response;
    }
    ControlResponse restart_response = restart(module);
    std::string restart_outcome = restart_response.success ? "restart succeeded"
                                                           : "restart failed: " + restart_response.message;
    return ControlResponse::failure("Config write for " + module + " rejected: " + write_response.message +
                                    " (" + restart_outcome + ")");
}

} // namespace Control
} // namespace ArbitrageControl
