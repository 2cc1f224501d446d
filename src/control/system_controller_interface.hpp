#ifndef SYSTEM_CONTROLLER_INTERFACE_HPP
#define SYSTEM_CONTROLLER_INTERFACE_HPP

#include "control_types.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <string>
#include <vector>

namespace ArbitrageControl {
namespace Control {

constexpr int DEFAULT_LOG_LINES = 100;

/**
 * Uniform lifecycle contract implemented by every backend controller.
 *
 * No method throws: transport and backend failures come back as
 * ControlResponse{success=false}, a degraded SystemModule, or a
 * single-line diagnostic from logs().
 */
class SystemControllerInterface {
public:
    virtual ~SystemControllerInterface() = default;

    virtual ControlResponse start(const std::string& module) = 0;
    virtual ControlResponse stop(const std::string& module) = 0;
    virtual ControlResponse restart(const std::string& module) = 0;
    virtual SystemModule status(const std::string& module) = 0;
    virtual std::vector<std::string> logs(const std::string& module, int lines = DEFAULT_LOG_LINES) = 0;
    virtual ControlResponse update_config(const std::string& module, const nlohmann::json& config) = 0;

    // Commands whose keys are equal address the same backend resource and must not overlap
    virtual std::string sequencing_key(const std::string& module) const = 0;

    virtual DeploymentType get_deployment_type() const = 0;
    virtual std::string get_controller_name() const = 0;
};

using SystemControllerPtr = std::unique_ptr<SystemControllerInterface>;

} // namespace Control
} // namespace ArbitrageControl

#endif // SYSTEM_CONTROLLER_INTERFACE_HPP
