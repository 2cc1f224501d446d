#include "base_controller.hpp"
#include "logging/logs/control_logs.hpp"
#include <stdexcept>

using ArbitrageControl::Logging::ControlLogs;
using json = nlohmann::json;

namespace ArbitrageControl {
namespace Control {

namespace {
    constexpr std::size_t MAX_ERROR_BODY_CHARS = 200;

    std::string http_status_text(long status_code) {
        return "HTTP " + std::to_string(status_code);
    }

    std::string truncate_body(const std::string& body) {
        if (body.size() <= MAX_ERROR_BODY_CHARS) {
            return body;
        }
        return body.substr(0, MAX_ERROR_BODY_CHARS) + "...";
    }

    // Backend error bodies use either {"message": ...} or {"error": ...} / {"error": {"message": ...}}
    std::string extract_message(const json& body_json, long status_code) {
        if (body_json.contains("message") && body_json["message"].is_string()) {
            return body_json["message"].get<std::string>();
        }
        if (body_json.contains("error")) {
            const json& error_value = body_json["error"];
            if (error_value.is_string()) {
                return error_value.get<std::string>();
            }
            if (error_value.is_object() && error_value.contains("message") && error_value["message"].is_string()) {
                return error_value["message"].get<std::string>();
            }
        }
        return http_status_text(status_code);
    }
}

BaseController::BaseController(const Config::BackendEndpointConfig& endpoint_config, API::HttpClientPtr client)
    : endpoints(endpoint_config), http_client(std::move(client)) {
    if (!http_client) {
        throw std::invalid_argument("Controller requires an HTTP client");
    }
}

ControlResponse BaseController::translate_response(const API::HttpResponse& http_response) {
    const bool http_ok = http_response.is_success();

    if (http_response.body.empty()) {
        return ControlResponse{http_ok, http_status_text(http_response.status_code), nullptr};
    }

    json body_json = json::parse(http_response.body, nullptr, false);
    if (body_json.is_discarded()) {
        if (http_ok) {
            return ControlResponse::failure("Invalid JSON response (" + http_status_text(http_response.status_code) + "): " +
                                            truncate_body(http_response.body));
        }
        return ControlResponse::failure(http_status_text(http_response.status_code) + ": " + truncate_body(http_response.body));
    }

    if (!body_json.is_object()) {
        return ControlResponse{http_ok, http_status_text(http_response.status_code), body_json};
    }

    ControlResponse response;
    response.success = http_ok;
    if (http_ok && body_json.contains("success") && body_json["success"].is_boolean()) {
        response.success = body_json["success"].get<bool>();
    }
    response.message = extract_message(body_json, http_response.status_code);
    if (body_json.contains("data")) {
        response.data = body_json["data"];
    }
    return response;
}

ControlResponse BaseController::send_command(API::HttpMethod method, const std::string& path, const json& body,
                                             const std::string& operation, const std::string& module,
                                             bool* transport_failed) const {
    if (transport_failed) {
        *transport_failed = false;
    }
    try {
        API::HttpRequest http_request{method, build_url(endpoints.base_url, path), body.is_null() ? std::string() : body.dump()};
        return translate_response(http_client->send(http_request));
    } catch (const std::exception& exception_error) {
        if (transport_failed) {
            *transport_failed = true;
        }
        ControlLogs::log_transport_failure(get_controller_name(), operation, module, exception_error.what());
        return ControlResponse::failure("Failed to " + operation + " " + module + ": " + exception_error.what());
    }
}

json BaseController::fetch_json(const std::string& path, const QueryParameters& query_parameters) const {
    API::HttpRequest http_request{API::HttpMethod::GET, build_url(endpoints.base_url, path, query_parameters), ""};
    API::HttpResponse http_response = http_client->send(http_request);

    if (!http_response.is_success()) {
        json error_json = json::parse(http_response.body, nullptr, false);
        if (!error_json.is_discarded() && error_json.is_object()) {
            throw std::runtime_error(http_status_text(http_response.status_code) + ": " +
                                     extract_message(error_json, http_response.status_code));
        }
        throw std::runtime_error(http_status_text(http_response.status_code) + " from " + path);
    }

    json body_json = json::parse(http_response.body, nullptr, false);
    if (body_json.is_discarded()) {
        throw std::runtime_error("Invalid JSON response from " + path);
    }
    return body_json;
}

std::vector<std::string> BaseController::fetch_logs(const std::string& path, const QueryParameters& query_parameters,
                                                    const std::string& module) const {
    try {
        json response_json = fetch_json(path, query_parameters);

        std::vector<std::string> log_lines;
        if (!response_json.is_object() || !response_json.contains("logs") || response_json["logs"].is_null()) {
            return log_lines;
        }
        if (!response_json["logs"].is_array()) {
            throw std::runtime_error("logs field is not an array");
        }

        for (const auto& log_entry : response_json["logs"]) {
            log_lines.push_back(log_entry.is_string() ? log_entry.get<std::string>() : log_entry.dump());
        }
        return log_lines;
    } catch (const std::exception& exception_error) {
        ControlLogs::log_logs_fetch_failed(get_controller_name(), module, exception_error.what());
        return {std::string("Error fetching logs: ") + exception_error.what()};
    }
}

std::string BaseController::resource_name(const std::string& module) {
    return std::string(RESOURCE_NAME_PREFIX) + module;
}

int BaseController::normalize_line_count(int lines) {
    return lines > 0 ? lines : DEFAULT_LOG_LINES;
}

} // namespace Control
} // namespace ArbitrageControl
