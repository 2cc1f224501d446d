#ifndef HTTP_UTILS_HPP
#define HTTP_UTILS_HPP

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

using QueryParameters = std::vector<std::pair<std::string, std::string>>;

size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* response_string);

// RFC 3986 percent-encoding; unreserved characters pass through
std::string url_encode(const std::string& value);

// Joins base and path with exactly one slash, then appends the encoded query in the given order
std::string build_url(const std::string& base_url, const std::string& path, const QueryParameters& query_parameters = {});

#endif // HTTP_UTILS_HPP
