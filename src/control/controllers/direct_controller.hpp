#ifndef DIRECT_CONTROLLER_HPP
#define DIRECT_CONTROLLER_HPP

#include "base_controller.hpp"
#include <mutex>
#include <set>

namespace ArbitrageControl {
namespace Control {

constexpr int DIRECT_RESTART_DELAY_MS = 2000;
constexpr const char* DIRECT_PROCESS_KEY = "arbitrage-process";

/**
 * Controls the single locally spawned arbitrage process through its own
 * /api/system endpoints. That process hosts every module, so all module
 * names address the same process.
 */
class DirectController : public BaseController {
private:
    mutable std::mutex alias_mutex;
    std::set<std::string> aliased_modules;

    void note_module_alias(const std::string& module);

public:
    DirectController(const Config::BackendEndpointConfig& endpoint_config, API::HttpClientPtr client);

    ControlResponse start(const std::string& module) override;
    ControlResponse stop(const std::string& module) override;
    ControlResponse restart(const std::string& module) override;
    SystemModule status(const std::string& module) override;
    std::vector<std::string> logs(const std::string& module, int lines = DEFAULT_LOG_LINES) override;
    ControlResponse update_config(const std::string& module, const nlohmann::json& config) override;

    std::string sequencing_key(const std::string&) const override { return DIRECT_PROCESS_KEY; }

    DeploymentType get_deployment_type() const override { return DeploymentType::DIRECT; }
    std::string get_controller_name() const override { return "DirectController"; }
};

} // namespace Control
} // namespace ArbitrageControl

#endif // DIRECT_CONTROLLER_HPP
