#ifndef API_CLIENT_CONFIG_HPP
#define API_CLIENT_CONFIG_HPP

#include <string>

namespace ArbitrageControl {
namespace Config {

struct HttpClientConfig {
    // Sent as "Authorization: Bearer <token>" when non-empty
    std::string api_token;
    int timeout_seconds{30};
    bool enable_ssl_verification{true};
};

} // namespace Config
} // namespace ArbitrageControl

#endif // API_CLIENT_CONFIG_HPP
