#ifndef LOGGING_THREAD_HPP
#define LOGGING_THREAD_HPP

#include <memory>
#include "logging/logger/async_logger.hpp"

namespace ArbitrageControl {
namespace Threads {

class LoggingThread {
public:
    LoggingThread(Logging::LoggingContext& context,
                  std::shared_ptr<Logging::AsyncLogger> logger,
                  int poll_interval_ms)
        : logging_context(&context), logger_ptr(std::move(logger)), poll_interval_milliseconds(poll_interval_ms) {}

    void operator()();

private:
    Logging::LoggingContext* logging_context;
    std::shared_ptr<Logging::AsyncLogger> logger_ptr;
    int poll_interval_milliseconds;

    void setup_logging_thread();
    void execute_logging_processing_loop();
};

} // namespace Threads
} // namespace ArbitrageControl

#endif // LOGGING_THREAD_HPP
