#ifndef K8S_CONTROLLER_HPP
#define K8S_CONTROLLER_HPP

#include "base_controller.hpp"

namespace ArbitrageControl {
namespace Control {

/**
 * Controls modules deployed as Kubernetes Deployments in one namespace.
 * Configuration is written to ConfigMap "arbitrage-<module>-config" and
 * picked up by a rollout restart.
 */
class K8sController : public BaseController {
private:
    ControlResponse scale(const std::string& module, int replicas, const std::string& operation);
    static std::string config_map_name(const std::string& module);
    static SystemModule parse_deployment(const nlohmann::json& deployment_json, const std::string& module);

public:
    K8sController(const Config::BackendEndpointConfig& endpoint_config, API::HttpClientPtr client);

    ControlResponse start(const std::string& module) override;
    ControlResponse stop(const std::string& module) override;
    ControlResponse restart(const std::string& module) override;
    SystemModule status(const std::string& module) override;
    std::vector<std::string> logs(const std::string& module, int lines = DEFAULT_LOG_LINES) override;
    ControlResponse update_config(const std::string& module, const nlohmann::json& config) override;

    DeploymentType get_deployment_type() const override { return DeploymentType::K8S; }
    std::string get_controller_name() const override { return "K8sController"; }
};

} // namespace Control
} // namespace ArbitrageControl

#endif // K8S_CONTROLLER_HPP
