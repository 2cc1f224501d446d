#ifndef ECS_CONTROLLER_HPP
#define ECS_CONTROLLER_HPP

#include "base_controller.hpp"

namespace ArbitrageControl {
namespace Control {

/**
 * Controls modules deployed as AWS ECS services. Start and stop set the
 * service desired count to 1 and 0; configuration lands in the task
 * environment and takes effect on the next task ECS launches.
 */
class EcsController : public BaseController {
private:
    ControlResponse set_desired_count(const std::string& module, int desired_count, const std::string& operation);
    static SystemModule parse_service_description(const nlohmann::json& service_json, const std::string& module);

public:
    EcsController(const Config::BackendEndpointConfig& endpoint_config, API::HttpClientPtr client);

    ControlResponse start(const std::string& module) override;
    ControlResponse stop(const std::string& module) override;
    ControlResponse restart(const std::string& module) override;
    SystemModule status(const std::string& module) override;
    std::vector<std::string> logs(const std::string& module, int lines = DEFAULT_LOG_LINES) override;
    ControlResponse update_config(const std::string& module, const nlohmann::json& config) override;

    DeploymentType get_deployment_type() const override { return DeploymentType::ECS; }
    std::string get_controller_name() const override { return "EcsController"; }
};

} // namespace Control
} // namespace ArbitrageControl

#endif // ECS_CONTROLLER_HPP
