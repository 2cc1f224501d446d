#ifndef SYSTEMD_CONTROLLER_HPP
#define SYSTEMD_CONTROLLER_HPP

#include "base_controller.hpp"
#include <cstdint>
#include <optional>

namespace ArbitrageControl {
namespace Control {

/**
 * Controls modules installed as systemd units through the control gateway.
 * Module "x" maps to unit "arbitrage-x.service".
 */
class SystemdController : public BaseController {
private:
    static std::string unit_name(const std::string& module);
    static std::optional<std::int64_t> parse_heartbeat(const nlohmann::json& heartbeat_value);
    static SystemModule parse_status_payload(const nlohmann::json& payload_data, const std::string& module);

public:
    SystemdController(const Config::BackendEndpointConfig& endpoint_config, API::HttpClientPtr client);

    ControlResponse start(const std::string& module) override;
    ControlResponse stop(const std::string& module) override;
    ControlResponse restart(const std::string& module) override;
    SystemModule status(const std::string& module) override;
    std::vector<std::string> logs(const std::string& module, int lines = DEFAULT_LOG_LINES) override;
    ControlResponse update_config(const std::string& module, const nlohmann::json& config) override;

    DeploymentType get_deployment_type() const override { return DeploymentType::SYSTEMD; }
    std::string get_controller_name() const override { return "SystemdController"; }
};

} // namespace Control
} // namespace ArbitrageControl

#endif // SYSTEMD_CONTROLLER_HPP
