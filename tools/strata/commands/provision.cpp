/**
 * strata CLI - provision command
 *
 * Bring the environment in line with a specification.
 */

#include "../common.hpp"
#include "strata/action.hpp"
#include "strata/executor.hpp"
#include "strata/platform.hpp"
#include "strata/snapshot.hpp"

#include <CLI/CLI.hpp>

namespace strata::cli::commands {

namespace {

struct ProvisionOptions {
    std::string spec_path;
    std::string snapshot_path = DEFAULT_SNAPSHOT_PATH;
    int retries = -1;
    size_t parallel = 0;
    bool dry_run = false;
};

bool load_or_create_snapshot(const std::string& path, const GlobalOptions& opts,
                             Snapshot& out) {
    if (!path_exists(path)) {
        spdlog::debug("no snapshot at {}, starting empty", path);
        out = Snapshot{};
        return true;
    }
    auto loaded = load_snapshot(path);
    if (!loaded.ok) {
        report_error(loaded.error, opts.json);
        return false;
    }
    out = loaded.snapshot;
    return true;
}

int show_dry_run(const GlobalOptions& opts, const ExecutionPlan& plan, const Snapshot& snapshot) {
    auto preview = preview_plan(plan, snapshot);

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["dry_run"] = true;
        j["steps"] = nlohmann::json::array();
        for (const auto& e : preview) {
            j["steps"].push_back({{"id", e.step_id},
                                  {"satisfied", e.satisfied},
                                  {"postcondition", e.postcondition},
                                  {"detail", e.detail}});
        }
        emit_json(j);
        return EXIT_OK;
    }

    size_t pending = 0;
    for (const auto& e : preview) {
        std::cout << (e.satisfied ? "  satisfied    " : "  would apply ") << e.step_id
                  << "  (" << e.postcondition << ")" << std::endl;
        if (!e.satisfied) ++pending;
    }
    std::cout << pending << " of " << preview.size() << " step(s) would be applied" << std::endl;
    return EXIT_OK;
}

int cmd_provision(const GlobalOptions& opts, const ProvisionOptions& prov_opts) {
    EngineConfig config;
    if (!load_config_and_logging(opts, config)) {
        return EXIT_FAILED;
    }

    // Flags override the config file
    if (prov_opts.retries >= 0) {
        config.executor.retry.max_retries = prov_opts.retries;
    }
    if (prov_opts.parallel > 0) {
        config.executor.parallel = prov_opts.parallel;
    }

    ProvisionSpec spec;
    ExecutionPlan plan;
    int exit_code = EXIT_OK;
    if (!load_spec_and_plan(prov_opts.spec_path, opts, spec, plan, exit_code)) {
        return exit_code;
    }

    Snapshot snapshot;
    if (!load_or_create_snapshot(prov_opts.snapshot_path, opts, snapshot)) {
        return EXIT_FAILED;
    }

    if (prov_opts.dry_run) {
        return show_dry_run(opts, plan, snapshot);
    }

    CancellationToken cancel;
    config.executor.cancel = &cancel;

    HostActionBackend backend(config.backend);
    Executor executor(backend, config.executor);
    ApplyResult result;
    {
        InterruptWatcher watcher(cancel);
        result = executor.apply(plan, std::move(snapshot));
    }

    // Partial state is persisted as well
    auto saved = save_snapshot(prov_opts.snapshot_path, result.snapshot);
    if (!saved.ok) {
        report_error("failed to write snapshot: " + saved.error, opts.json);
        return EXIT_FAILED;
    }

    size_t applied = 0, skipped = 0;
    for (const auto& r : result.results) {
        if (r.outcome == StepOutcome::Applied) ++applied;
        if (r.outcome == StepOutcome::Skipped) ++skipped;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = result.ok;
        j["spec"] = spec.source_path;
        j["snapshot"] = prov_opts.snapshot_path;
        j["revision"] = result.snapshot.revision();
        j["cancelled"] = result.cancelled;
        j["results"] = nlohmann::json::array();
        for (const auto& r : result.results) {
            nlohmann::json rj;
            rj["id"] = r.step_id;
            rj["outcome"] = step_outcome_to_string(r.outcome);
            rj["attempts"] = r.attempts;
            rj["reason"] = r.reason;
            if (r.outcome == StepOutcome::Failed) {
                rj["failure"] = error_kind_to_string(r.failure);
            }
            j["results"].push_back(rj);
        }
        if (result.error) {
            j["error"] = error_to_json(result.error);
        }
        emit_json(j);
        return result.ok ? EXIT_OK : EXIT_FAILED;
    }

    if (!opts.quiet) {
        for (const auto& r : result.results) {
            std::cout << "  " << step_outcome_to_string(r.outcome) << "  " << r.step_id;
            if (r.attempts > 1) {
                std::cout << " (" << r.attempts << " attempts)";
            }
            std::cout << std::endl;
        }
    }

    if (!result.ok) {
        report_error(result.error, false);
        return EXIT_FAILED;
    }

    if (!opts.quiet) {
        std::cout << "Provisioned " << spec.steps.size() << " step(s): " << applied
                  << " applied, " << skipped << " skipped (revision "
                  << result.snapshot.revision() << ")" << std::endl;
    }
    return EXIT_OK;
}

} // namespace

void setup_provision(CLI::App* app, GlobalOptions& opts) {
    static ProvisionOptions prov_opts;

    app->add_option("spec", prov_opts.spec_path, "Specification document")->required();
    app->add_option("--snapshot", prov_opts.snapshot_path, "Snapshot file to read and update");
    app->add_option("--retries", prov_opts.retries, "Retries per step on transient failure")
        ->check(CLI::NonNegativeNumber);
    app->add_option("--parallel", prov_opts.parallel, "Number of worker threads")
        ->check(CLI::PositiveNumber);
    app->add_flag("--dry-run", prov_opts.dry_run, "Show what would be applied");

    app->callback([&opts]() { std::exit(cmd_provision(opts, prov_opts)); });
}

} // namespace strata::cli::commands
