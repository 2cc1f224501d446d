#include "command_line.hpp"
#include "config_loader/config_loader.hpp"
#include "control/control_types.hpp"
#include "logging/logs/system_logs.hpp"
#include <map>

using json = nlohmann::json;

namespace ArbitrageControl {
namespace CLI {

namespace {
    const std::map<std::string, CommandType> COMMANDS_BY_NAME = {
        {"type", CommandType::TYPE},
        {"start", CommandType::START},
        {"stop", CommandType::STOP},
        {"restart", CommandType::RESTART},
        {"status", CommandType::STATUS},
        {"logs", CommandType::LOGS},
        {"update-config", CommandType::UPDATE_CONFIG},
        {"start-all", CommandType::START_ALL},
        {"stop-all", CommandType::STOP_ALL},
        {"status-all", CommandType::STATUS_ALL}
    };

    const std::string LOG_FETCH_ERROR_PREFIX = "Error fetching logs:";

    int parse_line_count(const std::string& value) {
        try {
            size_t parsed_length = 0;
            int line_count = std::stoi(value, &parsed_length);
            if (parsed_length != value.size() || line_count <= 0) {
                throw UsageError("line count must be a positive integer: " + value);
            }
            return line_count;
        } catch (const UsageError&) {
            throw;
        } catch (const std::exception&) {
            throw UsageError("line count must be a positive integer: " + value);
        }
    }

    json response_map_to_json(const Control::ModuleResponseMap& responses, bool& all_succeeded) {
        json output_json = json::object();
        for (const auto& [module, response] : responses) {
            output_json[module] = Control::control_response_to_json(response);
            all_succeeded = all_succeeded && response.success;
        }
        return output_json;
    }

    json statuses_to_json(const std::vector<Control::SystemModule>& statuses, bool& all_succeeded) {
        json output_json = json::array();
        for (const auto& module_status : statuses) {
            output_json.push_back(Control::system_module_to_json(module_status));
            // A degraded snapshot means the backend could not be read
            all_succeeded = all_succeeded && module_status.status != Control::ModuleStatus::ERROR;
        }
        return output_json;
    }
}

std::string usage_text() {
    return "usage: arbctl [--config <csv>] <command> [args]\n"
           "  type                          print active deployment type\n"
           "  start|stop|restart <module>...\n"
           "  status [<module>...]          defaults to control.modules\n"
           "  logs <module> [lines]\n"
           "  update-config <module> <json>\n"
           "  start-all|stop-all|status-all\n";
}

CommandLineOptions parse_command_line(const std::vector<std::string>& arguments) {
    CommandLineOptions options;
    options.config_path = DEFAULT_CONTROL_CONFIG_PATH;

    size_t argument_index = 1;
    while (argument_index < arguments.size() && arguments[argument_index] == "--config") {
        if (argument_index + 1 >= arguments.size()) {
            throw UsageError("--config requires a path");
        }
        options.config_path = arguments[argument_index + 1];
        argument_index += 2;
    }

    if (argument_index >= arguments.size()) {
        throw UsageError("missing command");
    }

    options.command_name = arguments[argument_index++];
    auto command_iterator = COMMANDS_BY_NAME.find(options.command_name);
    if (command_iterator == COMMANDS_BY_NAME.end()) {
        throw UsageError("unknown command: " + options.command_name);
    }
    options.command = command_iterator->second;

    std::vector<std::string> command_arguments(arguments.begin() + static_cast<std::ptrdiff_t>(argument_index), arguments.end());

    switch (options.command) {
        case CommandType::TYPE:
        case CommandType::START_ALL:
        case CommandType::STOP_ALL:
        case CommandType::STATUS_ALL:
            if (!command_arguments.empty()) {
                throw UsageError(options.command_name + " takes no arguments");
            }
            break;
        case CommandType::START:
        case CommandType::STOP:
        case CommandType::RESTART:
            if (command_arguments.empty()) {
                throw UsageError(options.command_name + " requires at least one module");
            }
            options.modules = command_arguments;
            break;
        case CommandType::STATUS:
            options.modules = command_arguments;
            break;
        case CommandType::LOGS:
            if (command_arguments.empty() || command_arguments.size() > 2) {
                throw UsageError("logs requires <module> [lines]");
            }
            options.modules = {command_arguments[0]};
            if (command_arguments.size() == 2) {
                options.log_lines = parse_line_count(command_arguments[1]);
            }
            break;
        case CommandType::UPDATE_CONFIG:
            if (command_arguments.size() != 2) {
                throw UsageError("update-config requires <module> <json>");
            }
            options.modules = {command_arguments[0]};
            options.config_payload = json::parse(command_arguments[1], nullptr, false);
            if (options.config_payload.is_discarded()) {
                throw UsageError("update-config payload is not valid JSON");
            }
            break;
    }
    return options;
}

int run_command(Control::ControlFacade& control_facade, const CommandLineOptions& options,
                const std::vector<std::string>& default_modules, std::ostream& output) {
    bool all_succeeded = true;
    json output_json;

    switch (options.command) {
        case CommandType::TYPE:
            output_json = {
                {"deploymentType", Control::to_string(control_facade.get_deployment_type())},
                {"controller", control_facade.get_controller_name()}
            };
            break;
        case CommandType::START:
        case CommandType::STOP:
        case CommandType::RESTART: {
            Control::ModuleResponseMap responses;
            for (const auto& module : options.modules) {
                if (options.command == CommandType::START) {
                    responses[module] = control_facade.start_module(module);
                } else if (options.command == CommandType::STOP) {
                    responses[module] = control_facade.stop_module(module);
                } else {
                    responses[module] = control_facade.restart_module(module);
                }
            }
            output_json = response_map_to_json(responses, all_succeeded);
            break;
        }
        case CommandType::STATUS:
            output_json = statuses_to_json(
                control_facade.get_all_module_statuses(options.modules.empty() ? default_modules : options.modules),
                all_succeeded);
            break;
        case CommandType::STATUS_ALL:
            output_json = statuses_to_json(control_facade.get_all_module_statuses(default_modules), all_succeeded);
            break;
        case CommandType::LOGS: {
            const std::string& module = options.modules.front();
            std::vector<std::string> log_lines = control_facade.get_module_logs(module, options.log_lines);
            if (log_lines.size() == 1 && log_lines.front().rfind(LOG_FETCH_ERROR_PREFIX, 0) == 0) {
                all_succeeded = false;
            }
            output_json = {{"module", module}, {"logs", log_lines}};
            break;
        }
        case CommandType::UPDATE_CONFIG: {
            const std::string& module = options.modules.front();
            Control::ControlResponse response = control_facade.update_module_config(module, options.config_payload);
            all_succeeded = response.success;
            output_json = {{module, Control::control_response_to_json(response)}};
            break;
        }
        case CommandType::START_ALL:
            output_json = response_map_to_json(control_facade.start_all_modules(default_modules), all_succeeded);
            break;
        case CommandType::STOP_ALL:
            output_json = response_map_to_json(control_facade.stop_all_modules(default_modules), all_succeeded);
            break;
    }

    output << output_json.dump(2) << std::endl;
    Logging::SystemLogs::log_command_complete(options.command_name, all_succeeded);
    return all_succeeded ? EXIT_ALL_SUCCEEDED : EXIT_OPERATION_FAILED;
}

} // namespace CLI
} // namespace ArbitrageControl
