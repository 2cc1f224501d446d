#include "direct_controller.hpp"
#include "logging/logs/control_logs.hpp"
#include <chrono>
#include <stdexcept>
#include <thread>

using ArbitrageControl::Logging::ControlLogs;
using json = nlohmann::json;

namespace ArbitrageControl {
namespace Control {

DirectController::DirectController(const Config::BackendEndpointConfig& endpoint_config, API::HttpClientPtr client)
    : BaseController(endpoint_config, std::move(client)) {}

void DirectController::note_module_alias(const std::string& module) {
    bool first_use = false;
    {
        std::lock_guard<std::mutex> lock(alias_mutex);
        first_use = aliased_modules.insert(module).second;
    }
    if (first_use) {
        ControlLogs::log_direct_module_alias(module);
    }
}

ControlResponse DirectController::start(const std::string& module) {
    note_module_alias(module);
    return send_command(API::HttpMethod::POST, "/api/system/start", nullptr, "start", module);
}

ControlResponse DirectController::stop(const std::string& module) {
    note_module_alias(module);
    return send_command(API::HttpMethod::POST, "/api/system/stop", nullptr, "stop", module);
}

ControlResponse DirectController::restart(const std::string& module) {
    // The stop outcome does not gate the start; a process that was already down still comes up
    ControlResponse stop_response = stop(module);
    if (!stop_response.success) {
        ControlLogs::log_operation_result("stop", module, stop_response);
    }

    ControlLogs::log_direct_restart_delay(module, DIRECT_RESTART_DELAY_MS);
    std::this_thread::sleep_for(std::chrono::milliseconds(DIRECT_RESTART_DELAY_MS));

    return start(module);
}

SystemModule DirectController::status(const std::string& module) {
    note_module_alias(module);
    try {
        json response_json = fetch_json("/api/system/status");
        if (!response_json.is_object()) {
            throw std::runtime_error("status payload is not an object");
        }

        if (!response_json.contains("isRunning") || !response_json["isRunning"].is_boolean()) {
            throw std::runtime_error("status payload has no boolean isRunning");
        }
        bool is_running = response_json["isRunning"].get<bool>();

        SystemModule module_status;
        module_status.name = module;
        module_status.status = is_running ? ModuleStatus::RUNNING : ModuleStatus::STOPPED;
        module_status.health = is_running ? ModuleHealth::HEALTHY : ModuleHealth::UNKNOWN;
        return module_status;
    } catch (const std::exception& exception_error) {
        ControlLogs::log_status_degraded(get_controller_name(), module, exception_error.what());
        return make_degraded_module(module);
    }
}

std::vector<std::string> DirectController::logs(const std::string& module, int lines) {
    note_module_alias(module);
    return fetch_logs("/api/system/logs", {{"lines", std::to_string(normalize_line_count(lines))}}, module);
}

ControlResponse DirectController::update_config(const std::string& module, const json& config) {
    note_module_alias(module);
    ControlResponse response = send_command(API::HttpMethod::POST, "/api/config/update", config, "update config for", module);
    if (!response.success) {
        ControlLogs::log_config_write_failed(get_controller_name(), module, response.message);
    }
    return response;
}

} // namespace Control
} // namespace ArbitrageControl
