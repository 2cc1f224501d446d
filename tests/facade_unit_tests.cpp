#include <chrono>
#include <future>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "control/control_facade.hpp"
#include "control/controllers/direct_controller.hpp"
#include "control/controllers/systemd_controller.hpp"
#include "control/module_sequencer.hpp"
#include "test_support.hpp"

using ArbitrageControl::Control::ControlFacade;
using ArbitrageControl::Control::ControlResponse;
using ArbitrageControl::Control::DeploymentType;
using ArbitrageControl::Control::DirectController;
using ArbitrageControl::Control::SystemdController;
using ArbitrageControl::Control::ModuleSequencer;
using ArbitrageControl::Control::ModuleStatus;
using test_support::ControllerCall;
using test_support::FakeController;
using test_support::FakeHttpClient;
using test_support::fail;

namespace {

struct FacadeWithFake {
  FakeController* controller;
  std::unique_ptr<ControlFacade> facade;
};

FacadeWithFake make_facade(bool serialize, std::vector<std::string> failing_modules = {},
                           std::chrono::milliseconds call_delay = std::chrono::milliseconds(0)) {
  auto controller = std::make_unique<FakeController>();
  controller->failing_modules = std::move(failing_modules);
  controller->call_delay = call_delay;
  FakeController* raw_controller = controller.get();
  return FacadeWithFake{raw_controller, std::make_unique<ControlFacade>(std::move(controller), serialize)};
}

int test_batch_records_every_module() {
  auto fixture = make_facade(true, {"qingxi"});
  const std::vector<std::string> modules = {"system", "qingxi", "celue"};

  auto results = fixture.facade->start_all_modules(modules);
  if (results.size() != 3) {
    return fail("test_batch_records_every_module", "expected three keys");
  }
  if (!results["system"].success || results["qingxi"].success || !results["celue"].success) {
    return fail("test_batch_records_every_module", "per-module outcomes wrong");
  }

  auto calls = fixture.controller->calls();
  if (calls.size() != 3 || calls[0].module != "system" || calls[1].module != "qingxi" || calls[2].module != "celue") {
    return fail("test_batch_records_every_module", "batch must run in input order without short-circuit");
  }
  for (size_t i = 1; i < calls.size(); ++i) {
    if (calls[i].started_at < calls[i - 1].finished_at) {
      return fail("test_batch_records_every_module", "batch calls overlapped");
    }
  }

  auto stop_results = fixture.facade->stop_all_modules(modules);
  if (stop_results.size() != 3 || stop_results["qingxi"].success) {
    return fail("test_batch_records_every_module", "stop batch outcomes");
  }
  return 0;
}

int test_status_batch_keeps_order() {
  auto fixture = make_facade(true, {"risk"});
  auto statuses = fixture.facade->get_all_module_statuses({"risk", "system"});
  if (statuses.size() != 2 || statuses[0].name != "risk" || statuses[1].name != "system") {
    return fail("test_status_batch_keeps_order", "order not preserved");
  }
  if (statuses[0].status != ModuleStatus::ERROR || statuses[1].status != ModuleStatus::RUNNING) {
    return fail("test_status_batch_keeps_order", "statuses not delegated");
  }
  return 0;
}

int test_same_module_commands_are_ordered() {
  auto fixture = make_facade(true, {}, std::chrono::milliseconds(150));

  auto first = fixture.facade->restart_module_async("celue");
  auto second = fixture.facade->stop_module_async("celue");
  if (!first.get().success || !second.get().success) {
    return fail("test_same_module_commands_are_ordered", "async commands failed");
  }

  auto calls = fixture.controller->calls();
  if (calls.size() != 2) {
    return fail("test_same_module_commands_are_ordered", "expected two calls");
  }
  const ControllerCall& earlier = calls[0].started_at <= calls[1].started_at ? calls[0] : calls[1];
  const ControllerCall& later = calls[0].started_at <= calls[1].started_at ? calls[1] : calls[0];
  if (later.started_at < earlier.finished_at) {
    return fail("test_same_module_commands_are_ordered", "commands for one module overlapped");
  }
  return 0;
}

int test_direct_modules_share_one_lock() {
  ArbitrageControl::Config::BackendEndpointConfig endpoints;
  endpoints.base_url = "http://gateway:9000";
  auto http_client = std::make_shared<FakeHttpClient>();
  http_client->response_delay = std::chrono::milliseconds(200);

  auto direct = std::make_unique<DirectController>(endpoints, http_client);
  if (direct->sequencing_key("qingxi") != direct->sequencing_key("celue")) {
    return fail("test_direct_modules_share_one_lock", "direct modules must map to one key");
  }
  SystemdController systemd(endpoints, http_client);
  if (systemd.sequencing_key("qingxi") == systemd.sequencing_key("celue")) {
    return fail("test_direct_modules_share_one_lock", "systemd units must keep separate keys");
  }

  ControlFacade facade(std::move(direct), true);
  auto started = facade.start_module_async("qingxi");
  auto stopped = facade.stop_module_async("celue");
  if (!started.get().success || !stopped.get().success) {
    return fail("test_direct_modules_share_one_lock", "commands failed");
  }
  if (http_client->requests().size() != 2) {
    return fail("test_direct_modules_share_one_lock", "expected one request per command");
  }
  if (http_client->max_in_flight() != 1) {
    return fail("test_direct_modules_share_one_lock", "commands on the shared process overlapped");
  }
  return 0;
}

int test_sequencer_tracks_modules_independently() {
  ModuleSequencer sequencer;
  {
    auto system_lock = sequencer.acquire("system");
    // A different module must not block while "system" is held
    auto other = std::async(std::launch::async, [&sequencer]() {
      auto risk_lock = sequencer.acquire("risk");
      return true;
    });
    if (other.wait_for(std::chrono::seconds(2)) != std::future_status::ready) {
      return fail("test_sequencer_tracks_modules_independently", "independent module blocked");
    }
    auto unlocked = sequencer.acquire("system", false);
  }
  if (sequencer.tracked_module_count() != 2) {
    return fail("test_sequencer_tracks_modules_independently", "disabled acquire must not register a module");
  }
  return 0;
}

int test_async_variants_return_results() {
  auto fixture = make_facade(false, {"risk"});

  auto status_future = fixture.facade->get_module_status_async("system");
  auto logs_future = fixture.facade->get_module_logs_async("risk", 10);
  auto config_future = fixture.facade->update_module_config_async("celue", nlohmann::json{{"depth", 3}});

  if (status_future.get().status != ModuleStatus::RUNNING) {
    return fail("test_async_variants_return_results", "status future");
  }
  auto log_lines = logs_future.get();
  if (log_lines.size() != 1 || log_lines[0].rfind("Error fetching logs:", 0) != 0) {
    return fail("test_async_variants_return_results", "logs future");
  }
  if (!config_future.get().success || fixture.controller->last_config["depth"] != 3) {
    return fail("test_async_variants_return_results", "update_config future");
  }
  if (fixture.facade->is_serializing_module_commands()) {
    return fail("test_async_variants_return_results", "serialization flag not honoured");
  }
  return 0;
}

int test_facade_resolves_backend_from_config() {
  auto http_client = std::make_shared<FakeHttpClient>();

  ArbitrageControl::Config::SystemConfig config;
  config.control.deployment_type = " K8S ";
  ControlFacade k8s_facade(config, http_client);
  if (k8s_facade.get_deployment_type() != DeploymentType::K8S || k8s_facade.get_controller_name() != "K8sController") {
    return fail("test_facade_resolves_backend_from_config", "K8S not selected");
  }

  config.control.deployment_type = "nomad";
  ControlFacade fallback_facade(config, http_client);
  if (fallback_facade.get_deployment_type() != DeploymentType::DIRECT) {
    return fail("test_facade_resolves_backend_from_config", "unrecognized type should fall back to direct");
  }

  ControlResponse response = fallback_facade.start_module("system");
  if (!response.success || http_client->requests().back().request.url != "http://localhost:8080/api/system/start") {
    return fail("test_facade_resolves_backend_from_config", "default base URL not used");
  }
  return 0;
}

}  // namespace

int main() {
  test_support::ScopedLoggingContext logging_context;

  if (int rc = test_batch_records_every_module(); rc != 0) {
    return rc;
  }
  if (int rc = test_status_batch_keeps_order(); rc != 0) {
    return rc;
  }
  if (int rc = test_same_module_commands_are_ordered(); rc != 0) {
    return rc;
  }
  if (int rc = test_direct_modules_share_one_lock(); rc != 0) {
    return rc;
  }
  if (int rc = test_sequencer_tracks_modules_independently(); rc != 0) {
    return rc;
  }
  if (int rc = test_async_variants_return_results(); rc != 0) {
    return rc;
  }
  if (int rc = test_facade_resolves_backend_from_config(); rc != 0) {
    return rc;
  }

  std::cout << "[PASS] facade unit tests\n";
  return 0;
}
