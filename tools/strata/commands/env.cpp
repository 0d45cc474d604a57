/**
 * strata CLI - env command
 *
 * Print composed environment variables as shell exports.
 */

#include "../common.hpp"
#include "strata/postcondition.hpp"
#include "strata/snapshot.hpp"

#include <CLI/CLI.hpp>

#include <cstring>

namespace strata::cli::commands {

namespace {

struct EnvOptions {
    std::string snapshot_path = DEFAULT_SNAPSHOT_PATH;
};

std::string shell_quote(const std::string& value) {
    std::string out = "'";
    for (char c : value) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out += c;
        }
    }
    out += "'";
    return out;
}

int cmd_env(const GlobalOptions& opts, const EnvOptions& env_opts) {
    EngineConfig config;
    if (!load_config_and_logging(opts, config)) {
        return EXIT_FAILED;
    }

    auto loaded = load_snapshot(env_opts.snapshot_path);
    if (!loaded.ok) {
        report_error(loaded.error, opts.json);
        return EXIT_FAILED;
    }

    const size_t prefix_len = std::strlen(ENVVAR_KEY_PREFIX);
    nlohmann::json vars = nlohmann::json::object();

    for (const auto& [key, value] : loaded.snapshot.resources()) {
        if (key.compare(0, prefix_len, ENVVAR_KEY_PREFIX) != 0) continue;
        std::string name = key.substr(prefix_len);
        if (!is_environment_variable_name(name)) {
            diagnostics().warn("skipping " + key + ": not an environment variable name");
            continue;
        }
        if (opts.json) {
            vars[name] = value;
        } else {
            std::cout << "export " << name << "=" << shell_quote(value) << std::endl;
        }
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["env"] = vars;
        emit_json(j);
    }
    return EXIT_OK;
}

} // namespace

void setup_env(CLI::App* app, GlobalOptions& opts) {
    static EnvOptions env_opts;

    app->add_option("snapshot", env_opts.snapshot_path, "Snapshot file");

    app->callback([&opts]() { std::exit(cmd_env(opts, env_opts)); });
}

} // namespace strata::cli::commands
