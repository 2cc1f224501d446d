#include "deployment_type_resolver.hpp"
#include <algorithm>
#include <cctype>
#include <optional>

namespace ArbitrageControl {
namespace Control {

namespace {
    std::optional<DeploymentType> match_token(const std::string& raw_config_value) {
        const char* whitespace_chars = " \t\r\n";
        auto begin_position = raw_config_value.find_first_not_of(whitespace_chars);
        if (begin_position == std::string::npos) {
            return std::nullopt;
        }
        auto end_position = raw_config_value.find_last_not_of(whitespace_chars);

        std::string token = raw_config_value.substr(begin_position, end_position - begin_position + 1);
        std::transform(token.begin(), token.end(), token.begin(),
                       [](unsigned char character) { return static_cast<char>(std::tolower(character)); });

        if (token == "systemd") return DeploymentType::SYSTEMD;
        if (token == "ecs") return DeploymentType::ECS;
        if (token == "k8s") return DeploymentType::K8S;
        if (token == "direct") return DeploymentType::DIRECT;
        return std::nullopt;
    }
}

DeploymentType DeploymentTypeResolver::resolve(const std::string& raw_config_value) noexcept {
    try {
        return match_token(raw_config_value).value_or(DeploymentType::DIRECT);
    } catch (const std::exception&) {
        // Allocation failure while normalizing; DIRECT needs no backend configuration
        return DeploymentType::DIRECT;
    }
}

bool DeploymentTypeResolver::is_recognized(const std::string& raw_config_value) noexcept {
    try {
        return match_token(raw_config_value).has_value();
    } catch (const std::exception&) {
        return false;
    }
}

} // namespace Control
} // namespace ArbitrageControl
