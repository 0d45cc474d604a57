#pragma once

#include "strata/action.hpp"
#include "strata/executor.hpp"
#include "strata/types.hpp"

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace strata {

// ============================================================================
// Engine Configuration
// ============================================================================
//
//   {
//     "$schema": "strata.config.v1",
//     "retries": 3,
//     "parallel": 4,
//     "backoff": { "initial_ms": 200, "multiplier": 2.0, "max_ms": 5000 },
//     "timeouts_ms": { "install-package": 600000 },
//     "retry_kinds": ["fetch-artifact", "install-package"],
//     "transient_exit_codes": [75],
//     "commands": { "install-package": "pip install {name}=={version}" },
//     "shell": "/bin/sh",
//     "log_level": "info"
//   }

constexpr const char* CONFIG_SCHEMA = "strata.config.v1";
constexpr const char* CONFIG_ENV_VAR = "STRATA_CONFIG";

struct EngineConfig {
    ExecutorOptions executor;
    HostBackendOptions backend;
    std::string log_level = "info";
    std::string source_path;
};

struct EngineConfigParseResult {
    bool ok = false;
    std::string error;
    EngineConfig config;
    std::vector<std::string> warnings;
};

EngineConfig get_default_config();

// Unknown keys and unrecognized kind names are reported as warnings
EngineConfigParseResult parse_engine_config(const std::string& json_str,
                                            const std::string& source_path = "");

EngineConfigParseResult load_engine_config(const std::string& path);

// --config flag, else $STRATA_CONFIG, else nullopt (built-in defaults)
std::optional<std::string> resolve_config_path(const std::string& flag_value);

} // namespace strata
