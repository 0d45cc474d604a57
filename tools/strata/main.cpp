#include <CLI/CLI.hpp>
#include "common.hpp"

namespace strata::cli::commands {
    void setup_provision(CLI::App* app, GlobalOptions& opts);
    void setup_verify(CLI::App* app, GlobalOptions& opts);
    void setup_plan(CLI::App* app, GlobalOptions& opts);
    void setup_show(CLI::App* app, GlobalOptions& opts);
    void setup_env(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace strata::cli;

    init_console_logging();

    CLI::App app{"strata - declarative environment provisioning"};
    app.set_version_flag("-V,--version", STRATA_VERSION);
    app.require_subcommand(0, 1);

    GlobalOptions opts;
    app.add_option("--config", opts.config, "Engine configuration file");
    app.add_option("--log-file", opts.log_file, "Also write log output to this file");
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Detailed progress");
    app.add_flag("-q,--quiet", opts.quiet, "Minimal output");

    // Commands
    auto* provision_cmd = app.add_subcommand("provision", "Apply a specification");
    commands::setup_provision(provision_cmd, opts);

    auto* verify_cmd = app.add_subcommand("verify", "Check postconditions against a snapshot");
    commands::setup_verify(verify_cmd, opts);

    auto* plan_cmd = app.add_subcommand("plan", "Print the execution order");
    commands::setup_plan(plan_cmd, opts);

    auto* show_cmd = app.add_subcommand("show", "Inspect a snapshot");
    commands::setup_show(show_cmd, opts);

    auto* env_cmd = app.add_subcommand("env", "Print composed environment variables");
    commands::setup_env(env_cmd, opts);

    CLI11_PARSE(app, argc, argv);

    if (app.get_subcommands().empty()) {
        std::cout << app.help() << '\n';
    }

    return 0;
}
