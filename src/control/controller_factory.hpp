#ifndef CONTROLLER_FACTORY_HPP
#define CONTROLLER_FACTORY_HPP

#include "system_controller_interface.hpp"
#include "api/general/http_client_interface.hpp"
#include "configs/control_config.hpp"

namespace ArbitrageControl {
namespace Control {

class ControllerFactory {
public:
    // Never returns null; any value outside the four known kinds yields a DirectController
    static SystemControllerPtr create(DeploymentType deployment_type,
                                      const Config::BackendEndpointConfig& endpoint_config,
                                      API::HttpClientPtr http_client);
};

} // namespace Control
} // namespace ArbitrageControl

#endif // CONTROLLER_FACTORY_HPP
