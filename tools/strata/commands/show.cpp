/**
 * strata CLI - show command
 *
 * Inspect a persisted snapshot.
 */

#include "../common.hpp"
#include "strata/snapshot.hpp"

#include <CLI/CLI.hpp>

namespace strata::cli::commands {

namespace {

struct ShowOptions {
    std::string snapshot_path = DEFAULT_SNAPSHOT_PATH;
};

int cmd_show(const GlobalOptions& opts, const ShowOptions& show_opts) {
    EngineConfig config;
    if (!load_config_and_logging(opts, config)) {
        return EXIT_FAILED;
    }

    auto loaded = load_snapshot(show_opts.snapshot_path);
    if (!loaded.ok) {
        report_error(loaded.error, opts.json);
        return EXIT_FAILED;
    }
    const Snapshot& snapshot = loaded.snapshot;

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["revision"] = snapshot.revision();
        j["updated_at"] = snapshot.updated_at();
        j["resources"] = snapshot.resources();
        j["provenance"] = snapshot.provenance();
        j["failures"] = snapshot.failures();
        emit_json(j);
        return EXIT_OK;
    }

    std::cout << "Snapshot " << show_opts.snapshot_path << std::endl;
    std::cout << "  Revision: " << snapshot.revision() << std::endl;
    if (!snapshot.updated_at().empty()) {
        std::cout << "  Updated: " << snapshot.updated_at() << std::endl;
    }

    std::cout << std::endl << "Resources:" << std::endl;
    for (const auto& [key, value] : snapshot.resources()) {
        std::cout << "  " << key << " = " << value << std::endl;
    }

    std::cout << std::endl << "Applied or satisfied steps:" << std::endl;
    for (const auto& [step_id, rev] : snapshot.provenance()) {
        std::cout << "  " << step_id << " @ " << rev << std::endl;
    }

    if (!snapshot.failures().empty()) {
        std::cout << std::endl << "Failed in the last run:" << std::endl;
        for (const auto& [step_id, reason] : snapshot.failures()) {
            std::cout << "  " << step_id << ": " << reason << std::endl;
        }
    }
    return EXIT_OK;
}

} // namespace

void setup_show(CLI::App* app, GlobalOptions& opts) {
    static ShowOptions show_opts;

    app->add_option("snapshot", show_opts.snapshot_path, "Snapshot file");

    app->callback([&opts]() { std::exit(cmd_show(opts, show_opts)); });
}

} // namespace strata::cli::commands
