#include "config_loader.hpp"
#include "logging/logger/async_logger.hpp"
#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

using ArbitrageControl::Logging::log_message;

namespace {
    inline std::string trim(const std::string& input_string) {
        const char* whitespace_chars = " \t\r\n";
        auto begin_position = input_string.find_first_not_of(whitespace_chars);
        auto end_position = input_string.find_last_not_of(whitespace_chars);
        if (begin_position == std::string::npos) return "";
        return input_string.substr(begin_position, end_position - begin_position + 1);
    }

    inline bool to_bool(const std::string& input_value) {
        std::string normalized_value = input_value;
        std::transform(normalized_value.begin(), normalized_value.end(), normalized_value.begin(), ::tolower);
        return normalized_value == "1" || normalized_value == "true" || normalized_value == "yes";
    }

    int to_int(const std::string& config_key, const std::string& config_value) {
        try {
            size_t parsed_length = 0;
            int parsed_value = std::stoi(config_value, &parsed_length);
            if (parsed_length != config_value.size()) {
                throw std::invalid_argument("trailing characters");
            }
            return parsed_value;
        } catch (const std::exception&) {
            throw std::runtime_error("Invalid integer for " + config_key + ": '" + config_value + "'");
        }
    }

    bool read_environment(const char* variable_name, std::string& out_value) {
        const char* env_value = std::getenv(variable_name);
        if (env_value == nullptr || *env_value == '\0') {
            return false;
        }
        out_value = env_value;
        return true;
    }
}

std::vector<std::string> split_module_list(const std::string& module_list) {
    std::vector<std::string> modules;
    std::stringstream list_stream(module_list);
    std::string module_entry;
    while (std::getline(list_stream, module_entry, ';')) {
        module_entry = trim(module_entry);
        if (!module_entry.empty()) {
            modules.push_back(module_entry);
        }
    }
    return modules;
}

bool load_config_from_csv(ArbitrageControl::Config::SystemConfig& cfg, const std::string& csv_path) {
    std::ifstream config_file_stream(csv_path);
    if (!config_file_stream.is_open()) {
        return false;
    }

    std::string config_line_string;
    while (std::getline(config_file_stream, config_line_string)) {
        config_line_string = trim(config_line_string);
        if (config_line_string.empty() || config_line_string[0] == '#') continue;

        std::stringstream config_line_stream(config_line_string);
        std::string config_key_string, config_value_string;
        if (!std::getline(config_line_stream, config_key_string, ',')) continue;
        if (!std::getline(config_line_stream, config_value_string)) config_value_string.clear();
        config_key_string = trim(config_key_string);
        config_value_string = trim(config_value_string);

        // Control backend
        if (config_key_string == "control.deployment_type") cfg.control.deployment_type = config_value_string;
        else if (config_key_string == "control.base_url") cfg.control.endpoints.base_url = config_value_string;
        else if (config_key_string == "control.ecs_cluster") cfg.control.endpoints.ecs_cluster = config_value_string;
        else if (config_key_string == "control.k8s_namespace") cfg.control.endpoints.k8s_namespace = config_value_string;
        else if (config_key_string == "control.api_token") cfg.http.api_token = config_value_string;
        else if (config_key_string == "control.modules") cfg.control.modules = split_module_list(config_value_string);
        else if (config_key_string == "control.serialize_module_commands") cfg.control.serialize_module_commands = to_bool(config_value_string);

        // HTTP transport
        else if (config_key_string == "http.timeout_seconds") cfg.http.timeout_seconds = to_int(config_key_string, config_value_string);
        else if (config_key_string == "http.enable_ssl_verification") cfg.http.enable_ssl_verification = to_bool(config_value_string);

        // Logging
        else if (config_key_string == "logging.log_file") cfg.logging.log_file = config_value_string;
        else if (config_key_string == "logging.poll_interval_ms") cfg.logging.poll_interval_ms = to_int(config_key_string, config_value_string);
    }
    return true;
}

void apply_environment_overrides(ArbitrageControl::Config::SystemConfig& cfg) {
    read_environment("ARBITRAGE_DEPLOYMENT_TYPE", cfg.control.deployment_type);
    read_environment("ARBITRAGE_API_URL", cfg.control.endpoints.base_url);
    read_environment("ARBITRAGE_ECS_CLUSTER", cfg.control.endpoints.ecs_cluster);
    read_environment("ARBITRAGE_K8S_NAMESPACE", cfg.control.endpoints.k8s_namespace);
    read_environment("ARBITRAGE_API_TOKEN", cfg.http.api_token);
}

int load_system_config(ArbitrageControl::Config::SystemConfig& config, const std::string& csv_path) {
    try {
        if (!load_config_from_csv(config, csv_path)) {
            log_message("Config file " + csv_path + " not found - using defaults and environment", "");
        }
        apply_environment_overrides(config);
    } catch (const std::exception& config_exception_error) {
        log_message("ERROR: Failed to load configuration from " + csv_path + ": " + config_exception_error.what(), "");
        return 1;
    }

    std::string validation_error;
    if (!validate_config(config, validation_error)) {
        log_message("ERROR: Configuration validation failed: " + validation_error, "");
        return 1;
    }
    return 0;
}

bool validate_config(const ArbitrageControl::Config::SystemConfig& config, std::string& error_message) {
    const std::string& base_url = config.control.endpoints.base_url;
    if (base_url.empty()) {
        error_message = "control.base_url is empty (set it in control_config.csv or ARBITRAGE_API_URL)";
        return false;
    }
    if (base_url.rfind("http://", 0) != 0 && base_url.rfind("https://", 0) != 0) {
        error_message = "control.base_url must start with http:// or https:// (got " + base_url + ")";
        return false;
    }
    if (config.http.timeout_seconds <= 0) {
        error_message = "http.timeout_seconds must be > 0";
        return false;
    }
    if (config.logging.poll_interval_ms <= 0) {
        error_message = "logging.poll_interval_ms must be > 0";
        return false;
    }
    return true;
}
