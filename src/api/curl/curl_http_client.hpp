#ifndef CURL_HTTP_CLIENT_HPP
#define CURL_HTTP_CLIENT_HPP

#include "api/general/http_client_interface.hpp"
#include "configs/api_client_config.hpp"

namespace ArbitrageControl {
namespace API {

class CurlHttpClient : public HttpClientInterface {
private:
    Config::HttpClientConfig config;

public:
    explicit CurlHttpClient(const Config::HttpClientConfig& client_config);
    ~CurlHttpClient() override = default;

    HttpResponse send(const HttpRequest& request) override;

    // Process-wide libcurl setup; call once before any thread sends and once at exit
    static void global_initialize();
    static void global_cleanup();
};

} // namespace API
} // namespace ArbitrageControl

#endif // CURL_HTTP_CLIENT_HPP
