#ifndef COMMAND_LINE_HPP
#define COMMAND_LINE_HPP

#include "control/control_facade.hpp"
#include <nlohmann/json.hpp>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace ArbitrageControl {
namespace CLI {

constexpr int EXIT_ALL_SUCCEEDED = 0;
constexpr int EXIT_OPERATION_FAILED = 1;
constexpr int EXIT_USAGE_ERROR = 2;

enum class CommandType {
    TYPE,
    START,
    STOP,
    RESTART,
    STATUS,
    LOGS,
    UPDATE_CONFIG,
    START_ALL,
    STOP_ALL,
    STATUS_ALL
};

struct CommandLineOptions {
    std::string config_path;
    CommandType command{CommandType::TYPE};
    std::string command_name;
    std::vector<std::string> modules;
    int log_lines{Control::DEFAULT_LOG_LINES};
    nlohmann::json config_payload;
};

class UsageError : public std::runtime_error {
public:
    explicit UsageError(const std::string& message) : std::runtime_error(message) {}
};

// argv[0] is skipped. Throws UsageError on unknown commands, missing arguments or malformed values.
CommandLineOptions parse_command_line(const std::vector<std::string>& arguments);

std::string usage_text();

// Runs the parsed command, writes one JSON document to output and returns the process exit code.
// default_modules is used by the *-all commands and by status without arguments.
int run_command(Control::ControlFacade& control_facade, const CommandLineOptions& options,
                const std::vector<std::string>& default_modules, std::ostream& output);

} // namespace CLI
} // namespace ArbitrageControl

#endif // COMMAND_LINE_HPP
