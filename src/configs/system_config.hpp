#ifndef SYSTEM_CONFIG_HPP
#define SYSTEM_CONFIG_HPP

#include "control_config.hpp"
#include "api_client_config.hpp"
#include "logging_config.hpp"

namespace ArbitrageControl {
namespace Config {

/**
 * Complete control client configuration.
 * Control config selects the backend, HTTP config shapes every request, logging config drives the async logger.
 */
struct SystemConfig {
    ControlConfig control;         // Deployment type, endpoints, module list
    HttpClientConfig http;         // Token, timeout, TLS verification
    LoggingConfig logging;         // Log file and flush interval
};

} // namespace Config
} // namespace ArbitrageControl

#endif // SYSTEM_CONFIG_HPP
