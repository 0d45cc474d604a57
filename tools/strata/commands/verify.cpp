/**
 * strata CLI - verify command
 *
 * Check every postcondition against a snapshot without changing anything.
 */

#include "../common.hpp"
#include "strata/action.hpp"
#include "strata/snapshot.hpp"
#include "strata/verifier.hpp"

#include <CLI/CLI.hpp>

namespace strata::cli::commands {

namespace {

struct VerifyOptions {
    std::string spec_path;
    std::string snapshot_path;
    bool live = false;
};

int cmd_verify(const GlobalOptions& opts, const VerifyOptions& verify_opts) {
    EngineConfig config;
    if (!load_config_and_logging(opts, config)) {
        return EXIT_FAILED;
    }

    ProvisionSpec spec;
    ExecutionPlan plan;
    int exit_code = EXIT_OK;
    if (!load_spec_and_plan(verify_opts.spec_path, opts, spec, plan, exit_code)) {
        return exit_code;
    }

    auto loaded = load_snapshot(verify_opts.snapshot_path);
    if (!loaded.ok) {
        report_error(loaded.error, opts.json);
        return EXIT_FAILED;
    }

    Snapshot snapshot = loaded.snapshot;
    if (verify_opts.live) {
        HostActionBackend backend(config.backend);
        snapshot = observe_live_state(spec.steps, snapshot, backend);
    }

    auto report = verify(spec.steps, snapshot);

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = report.all_hold();
        j["live"] = verify_opts.live;
        j["entries"] = nlohmann::json::array();
        for (const auto& e : report.entries) {
            j["entries"].push_back({{"id", e.step_id},
                                    {"postcondition", e.postcondition},
                                    {"holds", e.holds},
                                    {"status", verification_status_to_string(e.status)},
                                    {"detail", e.detail}});
        }
        emit_json(j);
        return report.all_hold() ? EXIT_OK : EXIT_FAILED;
    }

    for (const auto& e : report.entries) {
        if (e.holds) {
            if (!opts.quiet) {
                std::cout << "  ok     " << e.step_id << "  (" << e.postcondition << ")" << std::endl;
            }
        } else {
            std::cout << "  FAIL   " << e.step_id << "  " << e.detail << std::endl;
        }
    }

    if (!report.all_hold()) {
        std::cout << report.count(VerificationStatus::DriftDetected) << " drifted, "
                  << report.count(VerificationStatus::NeverAttempted) << " never attempted, "
                  << report.count(VerificationStatus::AttemptFailed) << " failed" << std::endl;
        return EXIT_FAILED;
    }

    if (!opts.quiet) {
        std::cout << "All " << report.entries.size() << " postcondition(s) hold" << std::endl;
    }
    return EXIT_OK;
}

} // namespace

void setup_verify(CLI::App* app, GlobalOptions& opts) {
    static VerifyOptions verify_opts;

    app->add_option("spec", verify_opts.spec_path, "Specification document")->required();
    app->add_option("--snapshot", verify_opts.snapshot_path, "Snapshot file")->required();
    app->add_flag("--live", verify_opts.live, "Re-read observable resources from the system");

    app->callback([&opts]() { std::exit(cmd_verify(opts, verify_opts)); });
}

} // namespace strata::cli::commands
