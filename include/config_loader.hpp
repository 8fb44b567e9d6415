#pragma once

#include <string>

#include "shield_config.hpp"

namespace powshield {

/**
 * Reads a JSON configuration file and applies each recognised field over the defaults.
 * Unknown keys are ignored; a known key with the wrong JSON type raises ConfigurationError.
 */
ShieldConfig load_config_file(const std::string& path);

// Same as load_config_file for an in-memory document.
ShieldConfig parse_config(const std::string& json_text);

// Applies POWSHIELD_* environment variables on top of an existing configuration.
void apply_env_overrides(ShieldConfig& config);

// Throws ConfigurationError when the configuration cannot serve the given role.
void validate_config(const ShieldConfig& config, ConfigRole role);

// Splits "a, b,c" into trimmed, non-empty entries.
std::vector<std::string> split_list(const std::string& value);

}
