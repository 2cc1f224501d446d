#ifndef SYSTEM_MANAGER_HPP
#define SYSTEM_MANAGER_HPP

#include <memory>
#include <string>
#include <thread>
#include "configs/system_config.hpp"
#include "control/control_facade.hpp"
#include "logging/logger/async_logger.hpp"

namespace ArbitrageControl {
namespace System {

struct SystemInitializationResult {
    std::shared_ptr<Logging::LoggingContext> logging_context;
    std::shared_ptr<Logging::AsyncLogger> logger;
    std::thread logging_thread;
    Config::SystemConfig config;
    std::unique_ptr<Control::ControlFacade> control_facade;

    SystemInitializationResult() = default;
    SystemInitializationResult(SystemInitializationResult&&) = default;
    SystemInitializationResult& operator=(SystemInitializationResult&&) = default;

    SystemInitializationResult(const SystemInitializationResult&) = delete;
    SystemInitializationResult& operator=(const SystemInitializationResult&) = delete;
};

// Config, logging, libcurl and the control facade. Throws std::runtime_error on any failure.
SystemInitializationResult initialize(const std::string& config_path);

// Flushes and joins the logging thread, releases libcurl. Safe on a partially initialized result.
void shutdown(SystemInitializationResult& initialization_result);

} // namespace System
} // namespace ArbitrageControl

#endif // SYSTEM_MANAGER_HPP
