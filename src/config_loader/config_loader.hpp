#ifndef CONFIG_LOADER_HPP
#define CONFIG_LOADER_HPP

#include <string>
#include <vector>
#include "configs/system_config.hpp"

constexpr const char* DEFAULT_CONTROL_CONFIG_PATH = "config/control_config.csv";

// Load key,value CSV into SystemConfig. Unknown keys are ignored. Returns false if the file cannot be opened.
// Throws std::runtime_error on a malformed numeric value.
bool load_config_from_csv(ArbitrageControl::Config::SystemConfig& cfg, const std::string& csv_path);

// ARBITRAGE_* environment variables take precedence over file values.
void apply_environment_overrides(ArbitrageControl::Config::SystemConfig& cfg);

// File (optional) then environment. Returns 0 on success, 1 on failure.
int load_system_config(ArbitrageControl::Config::SystemConfig& config, const std::string& csv_path);

// Validate system configuration. Returns true if valid, false otherwise with error message.
bool validate_config(const ArbitrageControl::Config::SystemConfig& config, std::string& errorMessage);

// "a;b; c" -> {"a","b","c"}; empty entries dropped
std::vector<std::string> split_module_list(const std::string& module_list);

#endif // CONFIG_LOADER_HPP
