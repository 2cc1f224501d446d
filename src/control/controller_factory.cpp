#include "controller_factory.hpp"
#include "controllers/systemd_controller.hpp"
#include "controllers/ecs_controller.hpp"
#include "controllers/k8s_controller.hpp"
#include "controllers/direct_controller.hpp"

namespace ArbitrageControl {
namespace Control {

SystemControllerPtr ControllerFactory::create(DeploymentType deployment_type,
                                              const Config::BackendEndpointConfig& endpoint_config,
                                              API::HttpClientPtr http_client) {
    switch (deployment_type) {
        case DeploymentType::SYSTEMD:
            return std::make_unique<SystemdController>(endpoint_config, std::move(http_client));
        case DeploymentType::ECS:
            return std::make_unique<EcsController>(endpoint_config, std::move(http_client));
        case DeploymentType::K8S:
            return std::make_unique<K8sController>(endpoint_config, std::move(http_client));
        case DeploymentType::DIRECT:
        default:
            return std::make_unique<DirectController>(endpoint_config, std::move(http_client));
    }
}

} // namespace Control
} // namespace ArbitrageControl
