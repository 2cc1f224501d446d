#ifndef HTTP_CLIENT_INTERFACE_HPP
#define HTTP_CLIENT_INTERFACE_HPP

#include <memory>
#include <stdexcept>
#include <string>

namespace ArbitrageControl {
namespace API {

enum class HttpMethod {
    GET,
    POST,
    PUT
};

struct HttpRequest {
    HttpMethod method;
    std::string url;
    std::string body; // leave empty for GET
};

struct HttpResponse {
    long status_code;
    std::string body;

    bool is_success() const { return status_code >= 200 && status_code < 300; }
};

// Network, DNS, TLS or timeout failure. Any HTTP status code is a response, not a TransportError.
class TransportError : public std::runtime_error {
public:
    explicit TransportError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * Generic "call this HTTP endpoint" primitive consumed by every backend controller.
 */
class HttpClientInterface {
public:
    virtual ~HttpClientInterface() = default;

    virtual HttpResponse send(const HttpRequest& request) = 0;
};

using HttpClientPtr = std::shared_ptr<HttpClientInterface>;

const char* http_method_to_string(HttpMethod method);

} // namespace API
} // namespace ArbitrageControl

#endif // HTTP_CLIENT_INTERFACE_HPP
