#include "curl_http_client.hpp"
#include "utils/http_utils.hpp"
#include <curl/curl.h>
#include <string>

namespace ArbitrageControl {
namespace API {

CurlHttpClient::CurlHttpClient(const Config::HttpClientConfig& client_config) : config(client_config) {
    if (config.timeout_seconds <= 0) {
        throw std::runtime_error("HTTP timeout must be greater than 0 seconds");
    }
}

void CurlHttpClient::global_initialize() {
    CURLcode init_result = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (init_result != CURLE_OK) {
        throw std::runtime_error(std::string("curl_global_init failed: ") + curl_easy_strerror(init_result));
    }
}

void CurlHttpClient::global_cleanup() {
    curl_global_cleanup();
}

HttpResponse CurlHttpClient::send(const HttpRequest& http_request) {
    CURL* curl_handle = curl_easy_init();
    if (!curl_handle) {
        throw TransportError("Failed to initialize CURL for HTTP " + std::string(http_method_to_string(http_request.method)) + " request");
    }

    std::string response;
    long http_response_code = 0;
    struct curl_slist* headers = nullptr;

    headers = curl_slist_append(headers, "Content-Type: application/json");
    headers = curl_slist_append(headers, "Accept: application/json");
    if (!config.api_token.empty()) {
        headers = curl_slist_append(headers, ("Authorization: Bearer " + config.api_token).c_str());
    }

    curl_easy_setopt(curl_handle, CURLOPT_URL, http_request.url.c_str());
    curl_easy_setopt(curl_handle, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl_handle, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_handle, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl_handle, CURLOPT_TIMEOUT, static_cast<long>(config.timeout_seconds));
    curl_easy_setopt(curl_handle, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl_handle, CURLOPT_SSL_VERIFYPEER, config.enable_ssl_verification ? 1L : 0L);
    curl_easy_setopt(curl_handle, CURLOPT_SSL_VERIFYHOST, config.enable_ssl_verification ? 2L : 0L);

    switch (http_request.method) {
        case HttpMethod::GET:
            curl_easy_setopt(curl_handle, CURLOPT_HTTPGET, 1L);
            break;
        case HttpMethod::POST:
            curl_easy_setopt(curl_handle, CURLOPT_POST, 1L);
            curl_easy_setopt(curl_handle, CURLOPT_POSTFIELDS, http_request.body.c_str());
            curl_easy_setopt(curl_handle, CURLOPT_POSTFIELDSIZE, static_cast<long>(http_request.body.size()));
            break;
        case HttpMethod::PUT:
            curl_easy_setopt(curl_handle, CURLOPT_CUSTOMREQUEST, "PUT");
            curl_easy_setopt(curl_handle, CURLOPT_POSTFIELDS, http_request.body.c_str());
            curl_easy_setopt(curl_handle, CURLOPT_POSTFIELDSIZE, static_cast<long>(http_request.body.size()));
            break;
    }

    CURLcode curl_result = curl_easy_perform(curl_handle);
    curl_easy_getinfo(curl_handle, CURLINFO_RESPONSE_CODE, &http_response_code);

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl_handle);

    if (curl_result != CURLE_OK) {
        throw TransportError("HTTP " + std::string(http_method_to_string(http_request.method)) + " failed: " +
                             std::string(curl_easy_strerror(curl_result)) + " URL: " + http_request.url);
    }

    return HttpResponse{http_response_code, response};
}

} // namespace API
} // namespace ArbitrageControl
