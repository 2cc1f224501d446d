#ifndef CONTROL_FACADE_HPP
#define CONTROL_FACADE_HPP

#include "system_controller_interface.hpp"
#include "module_sequencer.hpp"
#include "api/general/http_client_interface.hpp"
#include "configs/system_config.hpp"
#include <functional>
#include <future>
#include <map>
#include <string>
#include <vector>

namespace ArbitrageControl {
namespace Control {

using ModuleResponseMap = std::map<std::string, ControlResponse>;

/**
 * Single entry point for module lifecycle control. Holds exactly one backend
 * controller for its lifetime and adds batch operations, per-module command
 * ordering and operation logging on top of it.
 *
 * The *_async variants run on a worker thread and return immediately; the
 * facade must outlive every future it hands out.
 */
class ControlFacade {
private:
    SystemControllerPtr controller;
    ModuleSequencer sequencer;
    bool serialize_module_commands;

    ControlResponse run_mutating(const std::string& verb, const std::string& module,
                                 const std::function<ControlResponse()>& operation);

    template <typename ResultType>
    std::future<ResultType> run_async(std::function<ResultType()> operation);

public:
    ControlFacade(const Config::SystemConfig& config, API::HttpClientPtr http_client);
    ControlFacade(SystemControllerPtr backend_controller, bool serialize_commands);

    ControlFacade(const ControlFacade&) = delete;
    ControlFacade& operator=(const ControlFacade&) = delete;

    ControlResponse start_module(const std::string& module);
    ControlResponse stop_module(const std::string& module);
    ControlResponse restart_module(const std::string& module);
    SystemModule get_module_status(const std::string& module);
    std::vector<std::string> get_module_logs(const std::string& module, int lines = DEFAULT_LOG_LINES);
    ControlResponse update_module_config(const std::string& module, const nlohmann::json& config);

    std::future<ControlResponse> start_module_async(const std::string& module);
    std::future<ControlResponse> stop_module_async(const std::string& module);
    std::future<ControlResponse> restart_module_async(const std::string& module);
    std::future<SystemModule> get_module_status_async(const std::string& module);
    std::future<std::vector<std::string>> get_module_logs_async(const std::string& module, int lines = DEFAULT_LOG_LINES);
    std::future<ControlResponse> update_module_config_async(const std::string& module, const nlohmann::json& config);

    // Sequential in input order; a failure never stops the remaining modules
    ModuleResponseMap start_all_modules(const std::vector<std::string>& modules);
    ModuleResponseMap stop_all_modules(const std::vector<std::string>& modules);
    std::vector<SystemModule> get_all_module_statuses(const std::vector<std::string>& modules);

    DeploymentType get_deployment_type() const;
    std::string get_controller_name() const;
    bool is_serializing_module_commands() const { return serialize_module_commands; }
};

} // namespace Control
} // namespace ArbitrageControl

#endif // CONTROL_FACADE_HPP
