#include "control_facade.hpp"
#include "controller_factory.hpp"
#include "deployment_type_resolver.hpp"
#include "logging/logger/async_logger.hpp"
#include "logging/logs/control_logs.hpp"
#include <stdexcept>

using ArbitrageControl::Logging::ControlLogs;

namespace ArbitrageControl {
namespace Control {

ControlFacade::ControlFacade(const Config::SystemConfig& config, API::HttpClientPtr http_client)
    : serialize_module_commands(config.control.serialize_module_commands) {
    const std::string& raw_deployment_type = config.control.deployment_type;
    if (!raw_deployment_type.empty() && !DeploymentTypeResolver::is_recognized(raw_deployment_type)) {
        ControlLogs::log_unrecognized_deployment_type(raw_deployment_type);
    }

    DeploymentType deployment_type = DeploymentTypeResolver::resolve(raw_deployment_type);
    controller = ControllerFactory::create(deployment_type, config.control.endpoints, std::move(http_client));
    ControlLogs::log_backend_selected(to_string(deployment_type), controller->get_controller_name(),
                                      config.control.endpoints.base_url);
}

ControlFacade::ControlFacade(SystemControllerPtr backend_controller, bool serialize_commands)
    : controller(std::move(backend_controller)), serialize_module_commands(serialize_commands) {
    if (!controller) {
        throw std::invalid_argument("ControlFacade requires a controller");
    }
}

ControlResponse ControlFacade::run_mutating(const std::string& verb, const std::string& module,
                                            const std::function<ControlResponse()>& operation) {
    ControlLogs::log_operation(verb, module, to_string(controller->get_deployment_type()));
    ModuleSequencer::ModuleLock module_lock = sequencer.acquire(controller->sequencing_key(module),
                                                                       serialize_module_commands);
    ControlResponse response = operation();
    ControlLogs::log_operation_result(verb, module, response);
    return response;
}

ControlResponse ControlFacade::start_module(const std::string& module) {
    return run_mutating("Starting", module, [this, &module]() { return controller->start(module); });
}

ControlResponse ControlFacade::stop_module(const std::string& module) {
    return run_mutating("Stopping", module, [this, &module]() { return controller->stop(module); });
}

ControlResponse ControlFacade::restart_module(const std::string& module) {
    return run_mutating("Restarting", module, [this, &module]() { return controller->restart(module); });
}

ControlResponse ControlFacade::update_module_config(const std::string& module, const nlohmann::json& config) {
    return run_mutating("Updating config of", module, [this, &module, &config]() {
        return controller->update_config(module, config);
    });
}

SystemModule ControlFacade::get_module_status(const std::string& module) {
    ControlLogs::log_operation("Querying status of", module, to_string(controller->get_deployment_type()));
    return controller->status(module);
}

std::vector<std::string> ControlFacade::get_module_logs(const std::string& module, int lines) {
    ControlLogs::log_operation("Fetching logs of", module, to_string(controller->get_deployment_type()));
    return controller->logs(module, lines);
}

template <typename ResultType>
std::future<ResultType> ControlFacade::run_async(std::function<ResultType()> operation) {
    Logging::LoggingContext* caller_context = Logging::try_get_logging_context();
    return std::async(std::launch::async, [caller_context, operation]() {
        if (!caller_context) {
            return operation();
        }
        Logging::set_logging_context(*caller_context);
        Logging::set_log_thread_tag("ASYNC");
        ResultType result = operation();
        caller_context->clear_thread_tag();
        Logging::clear_logging_context();
        return result;
    });
}

std::future<ControlResponse> ControlFacade::start_module_async(const std::string& module) {
    return run_async<ControlResponse>([this, module]() { return start_module(module); });
}

std::future<ControlResponse> ControlFacade::stop_module_async(const std::string& module) {
    return run_async<ControlResponse>([this, module]() { return stop_module(module); });
}

std::future<ControlResponse> ControlFacade::restart_module_async(const std::string& module) {
    return run_async<ControlResponse>([this, module]() { return restart_module(module); });
}

std::future<SystemModule> ControlFacade::get_module_status_async(const std::string& module) {
    return run_async<SystemModule>([this, module]() { return get_module_status(module); });
}

std::future<std::vector<std::string>> ControlFacade::get_module_logs_async(const std::string& module, int lines) {
    return run_async<std::vector<std::string>>([this, module, lines]() { return get_module_logs(module, lines); });
}

std::future<ControlResponse> ControlFacade::update_module_config_async(const std::string& module, const nlohmann::json& config) {
    return run_async<ControlResponse>([this, module, config]() { return update_module_config(module, config); });
}

ModuleResponseMap ControlFacade::start_all_modules(const std::vector<std::string>& modules) {
    ModuleResponseMap results;
    int success_count = 0;
    for (const auto& module : modules) {
        ControlResponse response = start_module(module);
        if (response.success) {
            success_count++;
        }
        results[module] = response;
    }
    ControlLogs::log_batch_summary("start", static_cast<int>(modules.size()), success_count,
                                   to_string(controller->get_deployment_type()));
    return results;
}

ModuleResponseMap ControlFacade::stop_all_modules(const std::vector<std::string>& modules) {
    ModuleResponseMap results;
    int success_count = 0;
    for (const auto& module : modules) {
        ControlResponse response = stop_module(module);
        if (response.success) {
            success_count++;
        }
        results[module] = response;
    }
    ControlLogs::log_batch_summary("stop", static_cast<int>(modules.size()), success_count,
                                   to_string(controller->get_deployment_type()));
    return results;
}

std::vector<SystemModule> ControlFacade::get_all_module_statuses(const std::vector<std::string>& modules) {
    std::vector<SystemModule> statuses;
    statuses.reserve(modules.size());
    for (const auto& module : modules) {
        statuses.push_back(get_module_status(module));
    }
    return statuses;
}

DeploymentType ControlFacade::get_deployment_type() const {
    return controller->get_deployment_type();
}

std::string ControlFacade::get_controller_name() const {
    return controller->get_controller_name();
}

} // namespace Control
} // namespace ArbitrageControl
