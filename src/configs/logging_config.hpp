// LoggingConfig.hpp
#ifndef LOGGING_CONFIG_HPP
#define LOGGING_CONFIG_HPP

#include <string>

struct LoggingConfig {
    std::string log_file{"logs/arbitrage_control.log"};
    int poll_interval_ms{200};
    bool console_output{true};
};

#endif // LOGGING_CONFIG_HPP
