#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "config_loader/config_loader.hpp"
#include "utils/http_utils.hpp"
#include "utils/time_utils.hpp"
#include "test_support.hpp"

using ArbitrageControl::Config::SystemConfig;
using test_support::fail;

namespace {

const char* OVERRIDE_VARIABLES[] = {"ARBITRAGE_DEPLOYMENT_TYPE", "ARBITRAGE_API_URL", "ARBITRAGE_ECS_CLUSTER",
                                    "ARBITRAGE_K8S_NAMESPACE", "ARBITRAGE_API_TOKEN"};

void clear_overrides() {
  for (const char* variable : OVERRIDE_VARIABLES) {
    ::unsetenv(variable);
  }
}

std::filesystem::path write_config(const std::string& file_name, const std::string& contents) {
  std::filesystem::path config_path = std::filesystem::temp_directory_path() / file_name;
  std::ofstream out(config_path);
  out << contents;
  return config_path;
}

int test_loads_every_key() {
  clear_overrides();
  const auto config_path = write_config("arbctl_full_config.csv",
                                        "# comment\n"
                                        "control.deployment_type, ecs\n"
                                        "control.base_url,https://control.internal:8443\n"
                                        "control.ecs_cluster,prod\n"
                                        "control.k8s_namespace,trading\n"
                                        "control.api_token,secret-token\n"
                                        "control.modules,system; risk ;;celue\n"
                                        "control.serialize_module_commands,false\n"
                                        "\n"
                                        "http.timeout_seconds,12\n"
                                        "http.enable_ssl_verification,no\n"
                                        "logging.log_file,/tmp/arbctl.log\n"
                                        "logging.poll_interval_ms,50\n"
                                        "unknown.key,ignored\n");

  SystemConfig config;
  bool loaded = load_config_from_csv(config, config_path.string());
  std::error_code ec;
  std::filesystem::remove(config_path, ec);

  if (!loaded) {
    return fail("test_loads_every_key", "file not loaded");
  }
  if (config.control.deployment_type != "ecs" || config.control.endpoints.base_url != "https://control.internal:8443" ||
      config.control.endpoints.ecs_cluster != "prod" || config.control.endpoints.k8s_namespace != "trading") {
    return fail("test_loads_every_key", "control keys");
  }
  if (config.http.api_token != "secret-token" || config.http.timeout_seconds != 12 || config.http.enable_ssl_verification) {
    return fail("test_loads_every_key", "http keys");
  }
  if (config.control.modules != std::vector<std::string>{"system", "risk", "celue"} || config.control.serialize_module_commands) {
    return fail("test_loads_every_key", "module list or serialization flag");
  }
  if (config.logging.log_file != "/tmp/arbctl.log" || config.logging.poll_interval_ms != 50) {
    return fail("test_loads_every_key", "logging keys");
  }
  return 0;
}

int test_missing_file_keeps_defaults() {
  clear_overrides();
  SystemConfig config;
  if (load_system_config(config, "/nonexistent/arbctl/control_config.csv") != 0) {
    return fail("test_missing_file_keeps_defaults", "missing file must not be fatal");
  }
  if (config.control.endpoints.base_url != "http://localhost:8080" || config.control.endpoints.ecs_cluster != "default" ||
      config.control.endpoints.k8s_namespace != "default" || config.control.modules.size() != 4 ||
      config.http.timeout_seconds != 30 || !config.control.serialize_module_commands) {
    return fail("test_missing_file_keeps_defaults", "defaults changed");
  }
  return 0;
}

int test_environment_overrides_file() {
  clear_overrides();
  const auto config_path = write_config("arbctl_env_config.csv",
                                        "control.deployment_type,systemd\ncontrol.base_url,http://file:1\n");
  ::setenv("ARBITRAGE_DEPLOYMENT_TYPE", "k8s", 1);
  ::setenv("ARBITRAGE_API_URL", "http://env:2", 1);
  ::setenv("ARBITRAGE_K8S_NAMESPACE", "staging", 1);
  ::setenv("ARBITRAGE_API_TOKEN", "env-token", 1);

  SystemConfig config;
  int result = load_system_config(config, config_path.string());
  std::error_code ec;
  std::filesystem::remove(config_path, ec);
  clear_overrides();

  if (result != 0) {
    return fail("test_environment_overrides_file", "load failed");
  }
  if (config.control.deployment_type != "k8s" || config.control.endpoints.base_url != "http://env:2" ||
      config.control.endpoints.k8s_namespace != "staging" || config.http.api_token != "env-token") {
    return fail("test_environment_overrides_file", "environment did not take precedence");
  }
  if (config.control.endpoints.ecs_cluster != "default") {
    return fail("test_environment_overrides_file", "unset variable must leave the value alone");
  }
  return 0;
}

int test_malformed_number_throws() {
  clear_overrides();
  const auto config_path = write_config("arbctl_bad_config.csv", "http.timeout_seconds,thirty\n");

  bool threw = false;
  SystemConfig config;
  try {
    (void)load_config_from_csv(config, config_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }
  int result = load_system_config(config, config_path.string());
  std::error_code ec;
  std::filesystem::remove(config_path, ec);

  if (!threw) {
    return fail("test_malformed_number_throws", "expected runtime_error for non-numeric timeout");
  }
  if (result == 0) {
    return fail("test_malformed_number_throws", "load_system_config must report the failure");
  }
  return 0;
}

int test_validation_rules() {
  std::string error_message;

  SystemConfig valid;
  if (!validate_config(valid, error_message)) {
    return fail("test_validation_rules", "defaults should validate: " + error_message);
  }

  SystemConfig empty_url;
  empty_url.control.endpoints.base_url = "";
  if (validate_config(empty_url, error_message)) {
    return fail("test_validation_rules", "empty base URL accepted");
  }

  SystemConfig bad_scheme;
  bad_scheme.control.endpoints.base_url = "ftp://gateway";
  if (validate_config(bad_scheme, error_message)) {
    return fail("test_validation_rules", "non-http scheme accepted");
  }

  SystemConfig zero_timeout;
  zero_timeout.http.timeout_seconds = 0;
  if (validate_config(zero_timeout, error_message) || error_message.find("timeout") == std::string::npos) {
    return fail("test_validation_rules", "zero timeout accepted");
  }
  return 0;
}

int test_build_url_and_encoding() {
  if (build_url("http://host:1/", "/api/system/status") != "http://host:1/api/system/status") {
    return fail("test_build_url_and_encoding", "trailing slash not collapsed");
  }
  if (build_url("http://host:1", "api/x") != "http://host:1/api/x") {
    return fail("test_build_url_and_encoding", "missing slash not added");
  }
  if (build_url("http://h", "/logs", {{"service", "arbitrage-risk.service"}, {"lines", "5"}}) !=
      "http://h/logs?service=arbitrage-risk.service&lines=5") {
    return fail("test_build_url_and_encoding", "query parameters");
  }
  if (url_encode("a b&c=d/é") != "a%20b%26c%3Dd%2F%C3%A9") {
    return fail("test_build_url_and_encoding", "percent encoding: " + url_encode("a b&c=d/é"));
  }
  return 0;
}

int test_iso_time_parsing() {
  if (TimeUtils::parse_iso_time_to_epoch_milliseconds("1970-01-01T00:01:00Z") != 60000) {
    return fail("test_iso_time_parsing", "epoch offset");
  }
  bool threw = false;
  try {
    (void)TimeUtils::parse_iso_time_to_epoch_milliseconds("yesterday");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  if (!threw) {
    return fail("test_iso_time_parsing", "garbage accepted");
  }

  if (TimeUtils::parse_iso_time_to_epoch_milliseconds("1970-01-01T05:00:00+05:00") != 0) {
    return fail("test_iso_time_parsing", "positive offset not applied");
  }
  if (TimeUtils::parse_iso_time_to_epoch_milliseconds("1970-01-01T00:00:00.250-0130") != 5400000) {
    return fail("test_iso_time_parsing", "negative compact offset after fraction not applied");
  }
  if (TimeUtils::parse_iso_time_to_epoch_milliseconds("1970-01-01T00:01:00") != 60000) {
    return fail("test_iso_time_parsing", "timestamp without designator should read as UTC");
  }
  bool bad_offset_threw = false;
  try {
    (void)TimeUtils::parse_iso_time_to_epoch_milliseconds("2024-01-02T10:00:00 EST");
  } catch (const std::runtime_error&) {
    bad_offset_threw = true;
  }
  if (!bad_offset_threw) {
    return fail("test_iso_time_parsing", "unknown timezone designator accepted");
  }
  return 0;
}

}  // namespace

int main() {
  test_support::ScopedLoggingContext logging_context;

  if (int rc = test_loads_every_key(); rc != 0) {
    return rc;
  }
  if (int rc = test_missing_file_keeps_defaults(); rc != 0) {
    return rc;
  }
  if (int rc = test_environment_overrides_file(); rc != 0) {
    return rc;
  }
  if (int rc = test_malformed_number_throws(); rc != 0) {
    return rc;
  }
  if (int rc = test_validation_rules(); rc != 0) {
    return rc;
  }
  if (int rc = test_build_url_and_encoding(); rc != 0) {
    return rc;
  }
  if (int rc = test_iso_time_parsing(); rc != 0) {
    return rc;
  }

  std::cout << "[PASS] config unit tests\n";
  return 0;
}
