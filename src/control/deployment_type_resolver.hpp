#ifndef DEPLOYMENT_TYPE_RESOLVER_HPP
#define DEPLOYMENT_TYPE_RESOLVER_HPP

#include "control_types.hpp"
#include <string>

namespace ArbitrageControl {
namespace Control {

class DeploymentTypeResolver {
public:
    // Trimmed, case-insensitive match on systemd|ecs|k8s|direct. Empty (unset) or anything else resolves to DIRECT.
    static DeploymentType resolve(const std::string& raw_config_value) noexcept;

    static bool is_recognized(const std::string& raw_config_value) noexcept;
};

} // namespace Control
} // namespace ArbitrageControl

#endif // DEPLOYMENT_TYPE_RESOLVER_HPP
