#include "strata/engine_config.hpp"
#include "strata/platform.hpp"

#include <nlohmann/json.hpp>

namespace strata {

namespace {

std::optional<std::string> get_string(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

std::optional<long long> get_non_negative(const nlohmann::json& j, const std::string& key,
                                          std::vector<std::string>& warnings) {
    if (!j.contains(key)) {
        return std::nullopt;
    }
    if (!j[key].is_number_integer() || j[key].get<long long>() < 0) {
        warnings.push_back("invalid_configuration:" + key);
        return std::nullopt;
    }
    return j[key].get<long long>();
}

const char* const KNOWN_KEYS[] = {
    "$schema", "retries", "parallel", "backoff", "timeouts_ms", "retry_kinds",
    "transient_exit_codes", "commands", "shell", "log_level",
};

bool is_known_key(const std::string& key) {
    for (const char* known : KNOWN_KEYS) {
        if (key == known) return true;
    }
    return false;
}

bool is_log_level(const std::string& level) {
    return level == "trace" || level == "debug" || level == "info" || level == "warn" ||
           level == "error" || level == "critical" || level == "off";
}

} // namespace

EngineConfig get_default_config() {
    return EngineConfig{};
}

EngineConfigParseResult parse_engine_config(const std::string& json_str,
                                            const std::string& source_path) {
    EngineConfigParseResult result;
    EngineConfig& config = result.config;
    config.source_path = source_path;

    try {
        auto j = nlohmann::json::parse(json_str);

        if (!j.is_object()) {
            result.error = "JSON must be an object";
            return result;
        }

        auto schema = get_string(j, "$schema");
        if (!schema) {
            result.error = "$schema missing";
            return result;
        }
        if (*schema != CONFIG_SCHEMA) {
            result.error = std::string("$schema mismatch: expected ") + CONFIG_SCHEMA;
            return result;
        }

        for (const auto& item : j.items()) {
            if (!is_known_key(item.key())) {
                result.warnings.push_back("unknown_key:" + item.key());
            }
        }

        if (auto retries = get_non_negative(j, "retries", result.warnings)) {
            config.executor.retry.max_retries = static_cast<int>(*retries);
        }

        if (auto parallel = get_non_negative(j, "parallel", result.warnings)) {
            config.executor.parallel = *parallel == 0 ? 1 : static_cast<size_t>(*parallel);
        }

        // "backoff" section
        if (j.contains("backoff") && j["backoff"].is_object()) {
            const auto& backoff = j["backoff"];
            if (auto ms = get_non_negative(backoff, "initial_ms", result.warnings)) {
                config.executor.retry.initial_backoff = std::chrono::milliseconds(*ms);
            }
            if (auto ms = get_non_negative(backoff, "max_ms", result.warnings)) {
                config.executor.retry.max_backoff = std::chrono::milliseconds(*ms);
            }
            if (backoff.contains("multiplier")) {
                if (backoff["multiplier"].is_number() && backoff["multiplier"].get<double>() >= 1.0) {
                    config.executor.retry.multiplier = backoff["multiplier"].get<double>();
                } else {
                    result.warnings.push_back("invalid_configuration:multiplier");
                }
            }
        }

        // "timeouts_ms" section
        if (j.contains("timeouts_ms") && j["timeouts_ms"].is_object()) {
            for (auto& [kind_name, val] : j["timeouts_ms"].items()) {
                auto kind = parse_action_kind(kind_name);
                if (!kind) {
                    result.warnings.push_back("unknown_kind:" + kind_name);
                    continue;
                }
                if (!val.is_number_integer() || val.get<long long>() <= 0) {
                    result.warnings.push_back("invalid_configuration:timeouts_ms:" + kind_name);
                    continue;
                }
                config.executor.timeouts[*kind] = std::chrono::milliseconds(val.get<long long>());
            }
        }

        // "retry_kinds" replaces the default set
        if (j.contains("retry_kinds") && j["retry_kinds"].is_array()) {
            config.executor.retry_kinds.clear();
            for (const auto& elem : j["retry_kinds"]) {
                if (!elem.is_string()) continue;
                auto kind = parse_action_kind(elem.get<std::string>());
                if (kind) {
                    config.executor.retry_kinds.insert(*kind);
                } else {
                    result.warnings.push_back("unknown_kind:" + elem.get<std::string>());
                }
            }
        }

        if (j.contains("transient_exit_codes") && j["transient_exit_codes"].is_array()) {
            config.backend.transient_exit_codes.clear();
            for (const auto& elem : j["transient_exit_codes"]) {
                if (elem.is_number_integer()) {
                    config.backend.transient_exit_codes.insert(elem.get<int>());
                }
            }
        }

        // "commands" section
        if (j.contains("commands") && j["commands"].is_object()) {
            for (auto& [kind_name, val] : j["commands"].items()) {
                auto kind = parse_action_kind(kind_name);
                if (!kind) {
                    result.warnings.push_back("unknown_kind:" + kind_name);
                    continue;
                }
                if (val.is_string()) {
                    config.backend.commands[*kind] = val.get<std::string>();
                }
            }
        }

        if (auto shell = get_string(j, "shell")) {
            config.backend.shell = *shell;
        }

        if (auto level = get_string(j, "log_level")) {
            if (is_log_level(*level)) {
                config.log_level = *level;
            } else {
                result.warnings.push_back("invalid_configuration:log_level");
            }
        }

        result.ok = true;
        return result;

    } catch (const nlohmann::json::parse_error& e) {
        result.error = std::string("parse error: ") + e.what();
        return result;
    } catch (const nlohmann::json::exception& e) {
        result.error = std::string("JSON error: ") + e.what();
        return result;
    }
}

EngineConfigParseResult load_engine_config(const std::string& path) {
    auto content = read_file(path);
    if (!content) {
        EngineConfigParseResult result;
        result.error = "cannot read config: " + path;
        return result;
    }
    return parse_engine_config(*content, path);
}

std::optional<std::string> resolve_config_path(const std::string& flag_value) {
    if (!flag_value.empty()) {
        return flag_value;
    }
    auto env = get_env(CONFIG_ENV_VAR);
    if (env && !env->empty()) {
        return env;
    }
    return std::nullopt;
}

} // namespace strata
