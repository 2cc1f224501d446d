#ifndef BASE_CONTROLLER_HPP
#define BASE_CONTROLLER_HPP

#include "control/system_controller_interface.hpp"
#include "api/general/http_client_interface.hpp"
#include "configs/control_config.hpp"
#include "utils/http_utils.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace ArbitrageControl {
namespace Control {

constexpr const char* RESOURCE_NAME_PREFIX = "arbitrage-";

/**
 * Shared plumbing for the backend controllers: request dispatch over the
 * injected HTTP primitive and translation of gateway replies into
 * ControlResponse. Helpers named send_* never throw; fetch_json does and
 * is only called inside a controller's own try block.
 */
class BaseController : public SystemControllerInterface {
protected:
    Config::BackendEndpointConfig endpoints;
    API::HttpClientPtr http_client;

    // Issues the request and translates the reply; failures are returned, never thrown.
    // transport_failed, when given, is set if the gateway could not be reached at all.
    ControlResponse send_command(API::HttpMethod method, const std::string& path, const nlohmann::json& body,
                                 const std::string& operation, const std::string& module,
                                 bool* transport_failed = nullptr) const;

    // GET and parse; throws on transport failure, non-2xx or unparseable body
    nlohmann::json fetch_json(const std::string& path, const QueryParameters& query_parameters = {}) const;

    // GET a {"logs": [...]} payload; a single diagnostic line on any failure
    std::vector<std::string> fetch_logs(const std::string& path, const QueryParameters& query_parameters,
                                        const std::string& module) const;

    static std::string resource_name(const std::string& module);
    static int normalize_line_count(int lines);

public:
    BaseController(const Config::BackendEndpointConfig& endpoint_config, API::HttpClientPtr client);
    ~BaseController() override = default;

    std::string sequencing_key(const std::string& module) const override { return resource_name(module); }

    static ControlResponse translate_response(const API::HttpResponse& http_response);
};

} // namespace Control
} // namespace ArbitrageControl

#endif // BASE_CONTROLLER_HPP
