#ifndef CONTROL_CONFIG_HPP
#define CONTROL_CONFIG_HPP

#include <string>
#include <vector>

namespace ArbitrageControl {
namespace Config {

constexpr const char* DEFAULT_BASE_URL = "http://localhost:8080";
constexpr const char* DEFAULT_ECS_CLUSTER = "default";
constexpr const char* DEFAULT_K8S_NAMESPACE = "default";

/**
 * Backend identifiers bound once at construction.
 * Not hot-reloadable: a new facade is required to target another backend.
 */
struct BackendEndpointConfig {
    std::string base_url{DEFAULT_BASE_URL};
    std::string ecs_cluster{DEFAULT_ECS_CLUSTER};
    std::string k8s_namespace{DEFAULT_K8S_NAMESPACE};
};

struct ControlConfig {
    // Raw token as configured; resolved by DeploymentTypeResolver
    std::string deployment_type;
    BackendEndpointConfig endpoints;

    // Default module list for batch commands
    std::vector<std::string> modules{"system", "qingxi", "celue", "risk"};

    // Orders concurrent mutating commands against the same module
    bool serialize_module_commands{true};
};

} // namespace Config
} // namespace ArbitrageControl

#endif // CONTROL_CONFIG_HPP
