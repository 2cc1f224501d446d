// HttpUtils.cpp
#include "http_utils.hpp"
#include "api/general/http_client_interface.hpp"
#include <cctype>
#include <iomanip>
#include <sstream>

size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* response_string) {
    response_string->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

std::string url_encode(const std::string& value) {
    std::ostringstream encoded_stream;
    encoded_stream.fill('0');
    encoded_stream << std::hex << std::uppercase;

    for (const char character : value) {
        const unsigned char byte_value = static_cast<unsigned char>(character);
        if (std::isalnum(byte_value) || character == '-' || character == '_' || character == '.' || character == '~') {
            encoded_stream << character;
            continue;
        }
        encoded_stream << '%' << std::setw(2) << static_cast<int>(byte_value);
    }

    return encoded_stream.str();
}

std::string build_url(const std::string& base_url, const std::string& path, const QueryParameters& query_parameters) {
    std::string request_url = base_url;
    while (!request_url.empty() && request_url.back() == '/') {
        request_url.pop_back();
    }

    if (!path.empty() && path.front() != '/') {
        request_url += '/';
    }
    request_url += path;

    char separator = '?';
    for (const auto& query_parameter : query_parameters) {
        request_url += separator;
        request_url += url_encode(query_parameter.first) + "=" + url_encode(query_parameter.second);
        separator = '&';
    }

    return request_url;
}

namespace ArbitrageControl {
namespace API {

const char* http_method_to_string(HttpMethod method) {
    switch (method) {
        case HttpMethod::GET:
            return "GET";
        case HttpMethod::POST:
            return "POST";
        case HttpMethod::PUT:
            return "PUT";
    }
    return "GET";
}

} // namespace API
} // namespace ArbitrageControl
