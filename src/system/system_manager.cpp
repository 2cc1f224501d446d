#include "system_manager.hpp"
#include "api/curl/curl_http_client.hpp"
#include "config_loader/config_loader.hpp"
#include "logging/logs/startup_logs.hpp"
#include "logging/logs/system_logs.hpp"
#include "threads/system_threads/logging_thread.hpp"

using namespace ArbitrageControl::Logging;

namespace ArbitrageControl {
namespace System {

namespace {
    bool curl_initialized = false;
}

SystemInitializationResult initialize(const std::string& config_path) {
    SystemInitializationResult initialization_result;

    // Logging context first: config loading already logs
    initialization_result.logging_context = std::make_shared<LoggingContext>();
    set_logging_context(*initialization_result.logging_context);

    try {
        int config_load_result = load_system_config(initialization_result.config, config_path);
        if (config_load_result != 0) {
            throw std::runtime_error("configuration loading failed for " + config_path);
        }

        initialization_result.logger = initialize_application_foundation(initialization_result.config);
        initialization_result.logging_thread = std::thread(
            Threads::LoggingThread(*initialization_result.logging_context, initialization_result.logger,
                                   initialization_result.config.logging.poll_interval_ms));

        StartupLogs::log_application_header();
        StartupLogs::log_control_configuration(initialization_result.config);

        API::CurlHttpClient::global_initialize();
        curl_initialized = true;

        auto http_client = std::make_shared<API::CurlHttpClient>(initialization_result.config.http);
        initialization_result.control_facade = std::make_unique<Control::ControlFacade>(initialization_result.config, http_client);
    } catch (const std::exception& exception_error) {
        SystemLogs::log_fatal_error(std::string("System initialization failed: ") + exception_error.what());
        shutdown(initialization_result);
        clear_logging_context();
        throw;
    }

    return initialization_result;
}

void shutdown(SystemInitializationResult& initialization_result) {
    initialization_result.control_facade.reset();

    if (curl_initialized) {
        API::CurlHttpClient::global_cleanup();
        curl_initialized = false;
    }

    if (initialization_result.logger) {
        SystemLogs::log_shutdown();
        shutdown_global_logger(*initialization_result.logger);
    }
    if (initialization_result.logging_thread.joinable()) {
        initialization_result.logging_thread.join();
    }

    if (initialization_result.logging_context) {
        initialization_result.logging_context->async_logger.reset();
    }
    initialization_result.logger.reset();
}

} // namespace System
} // namespace ArbitrageControl
