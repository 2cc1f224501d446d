#ifndef TEST_SUPPORT_HPP
#define TEST_SUPPORT_HPP

#include <chrono>
#include <deque>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "api/general/http_client_interface.hpp"
#include "control/system_controller_interface.hpp"
#include "logging/logger/async_logger.hpp"

namespace test_support {

inline int fail(const char* name, const std::string& msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

// No async logger attached: log lines go straight to stderr
class ScopedLoggingContext {
 public:
  ScopedLoggingContext() { ArbitrageControl::Logging::set_logging_context(context_); }
  ~ScopedLoggingContext() { ArbitrageControl::Logging::clear_logging_context(); }

  ArbitrageControl::Logging::LoggingContext& context() { return context_; }

 private:
  ArbitrageControl::Logging::LoggingContext context_;
};

struct RecordedRequest {
  ArbitrageControl::API::HttpRequest request;
  std::chrono::steady_clock::time_point sent_at;
};

/**
 * Scripted HTTP primitive. Each send() consumes the next scripted step; once the
 * script runs out, fallback_response is returned.
 */
class FakeHttpClient : public ArbitrageControl::API::HttpClientInterface {
 public:
  void respond(long status_code, const std::string& body) {
    std::lock_guard<std::mutex> lock(mutex_);
    steps_.push_back(Step{false, ArbitrageControl::API::HttpResponse{status_code, body}, ""});
  }

  void fail_transport(const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    steps_.push_back(Step{true, ArbitrageControl::API::HttpResponse{0, ""}, message});
  }

  // Every request without a scripted step fails at the transport layer
  void fail_all_transport(const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    always_fail_ = true;
    always_fail_message_ = message;
  }

  ArbitrageControl::API::HttpResponse send(const ArbitrageControl::API::HttpRequest& request) override {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      requests_.push_back(RecordedRequest{request, std::chrono::steady_clock::now()});
      ++in_flight_;
      if (in_flight_ > max_in_flight_) {
        max_in_flight_ = in_flight_;
      }
    }
    if (response_delay.count() > 0) {
      std::this_thread::sleep_for(response_delay);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    --in_flight_;

    if (!steps_.empty()) {
      Step step = steps_.front();
      steps_.pop_front();
      if (step.throws) {
        throw ArbitrageControl::API::TransportError(step.error_message);
      }
      return step.response;
    }
    if (always_fail_) {
      throw ArbitrageControl::API::TransportError(always_fail_message_);
    }
    return fallback_response;
  }

  std::vector<RecordedRequest> requests() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_;
  }

  // Highest number of send() calls that were in progress at the same time
  int max_in_flight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return max_in_flight_;
  }

  ArbitrageControl::API::HttpResponse fallback_response{200, "{\"success\":true,\"message\":\"ok\"}"};
  std::chrono::milliseconds response_delay{0};

 private:
  struct Step {
    bool throws;
    ArbitrageControl::API::HttpResponse response;
    std::string error_message;
  };

  mutable std::mutex mutex_;
  std::deque<Step> steps_;
  std::vector<RecordedRequest> requests_;
  int in_flight_ = 0;
  int max_in_flight_ = 0;
  bool always_fail_ = false;
  std::string always_fail_message_;
};

struct ControllerCall {
  std::string verb;
  std::string module;
  std::chrono::steady_clock::time_point started_at;
  std::chrono::steady_clock::time_point finished_at;
};

/**
 * Controller double for facade tests. Modules listed in failing_modules get
 * success=false; every call can be slowed down by call_delay.
 */
class FakeController : public ArbitrageControl::Control::SystemControllerInterface {
 public:
  std::vector<std::string> failing_modules;
  std::chrono::milliseconds call_delay{0};

  ArbitrageControl::Control::ControlResponse start(const std::string& module) override { return mutate("start", module); }
  ArbitrageControl::Control::ControlResponse stop(const std::string& module) override { return mutate("stop", module); }
  ArbitrageControl::Control::ControlResponse restart(const std::string& module) override { return mutate("restart", module); }

  ArbitrageControl::Control::SystemModule status(const std::string& module) override {
    record("status", module, std::chrono::steady_clock::now());
    if (is_failing(module)) {
      return ArbitrageControl::Control::make_degraded_module(module);
    }
    ArbitrageControl::Control::SystemModule module_status;
    module_status.name = module;
    module_status.status = ArbitrageControl::Control::ModuleStatus::RUNNING;
    module_status.health = ArbitrageControl::Control::ModuleHealth::HEALTHY;
    return module_status;
  }

  std::vector<std::string> logs(const std::string& module, int lines) override {
    record("logs", module, std::chrono::steady_clock::now());
    if (is_failing(module)) {
      return {"Error fetching logs: backend down"};
    }
    return std::vector<std::string>(static_cast<size_t>(lines > 3 ? 3 : lines), module + " line");
  }

  ArbitrageControl::Control::ControlResponse update_config(const std::string& module, const nlohmann::json& config) override {
    last_config = config;
    return mutate("update_config", module);
  }

  std::string sequencing_key(const std::string& module) const override { return module; }

  ArbitrageControl::Control::DeploymentType get_deployment_type() const override {
    return ArbitrageControl::Control::DeploymentType::SYSTEMD;
  }
  std::string get_controller_name() const override { return "FakeController"; }

  std::vector<ControllerCall> calls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return calls_;
  }

  nlohmann::json last_config;

 private:
  ArbitrageControl::Control::ControlResponse mutate(const std::string& verb, const std::string& module) {
    auto started_at = std::chrono::steady_clock::now();
    if (call_delay.count() > 0) {
      std::this_thread::sleep_for(call_delay);
    }
    record(verb, module, started_at);
    if (is_failing(module)) {
      return ArbitrageControl::Control::ControlResponse::failure(verb + " " + module + " rejected");
    }
    return ArbitrageControl::Control::ControlResponse{true, verb + " " + module, nullptr};
  }

  void record(const std::string& verb, const std::string& module, std::chrono::steady_clock::time_point started_at) {
    std::lock_guard<std::mutex> lock(mutex_);
    calls_.push_back(ControllerCall{verb, module, started_at, std::chrono::steady_clock::now()});
  }

  bool is_failing(const std::string& module) const {
    for (const auto& failing : failing_modules) {
      if (failing == module) return true;
    }
    return false;
  }

  mutable std::mutex mutex_;
  std::vector<ControllerCall> calls_;
};

}  // namespace test_support

#endif  // TEST_SUPPORT_HPP
