/**
 * strata CLI - plan command
 *
 * Print the execution order of a specification.
 */

#include "../common.hpp"

#include <CLI/CLI.hpp>

namespace strata::cli::commands {

namespace {

struct PlanOptions {
    std::string spec_path;
};

int cmd_plan(const GlobalOptions& opts, const PlanOptions& plan_opts) {
    EngineConfig config;
    if (!load_config_and_logging(opts, config)) {
        return EXIT_FAILED;
    }

    ProvisionSpec spec;
    ExecutionPlan plan;
    int exit_code = EXIT_OK;
    if (!load_spec_and_plan(plan_opts.spec_path, opts, spec, plan, exit_code)) {
        return exit_code;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["name"] = spec.name;
        j["order"] = plan.order();
        j["steps"] = nlohmann::json::array();
        for (const auto& entry : plan.entries) {
            j["steps"].push_back({{"id", entry.step.id},
                                  {"kind", action_kind_to_string(entry.step.kind)},
                                  {"requires", entry.step.prerequisites}});
        }
        emit_json(j);
        return EXIT_OK;
    }

    if (!spec.name.empty()) {
        std::cout << spec.name << std::endl;
    }
    for (size_t i = 0; i < plan.entries.size(); ++i) {
        const Step& step = plan.entries[i].step;
        std::cout << "  " << (i + 1) << ". " << step.id << " [" << action_kind_to_string(step.kind)
                  << "]";
        if (!step.prerequisites.empty()) {
            std::cout << " after ";
            for (size_t p = 0; p < step.prerequisites.size(); ++p) {
                if (p > 0) std::cout << ", ";
                std::cout << step.prerequisites[p];
            }
        }
        std::cout << std::endl;
    }
    return EXIT_OK;
}

} // namespace

void setup_plan(CLI::App* app, GlobalOptions& opts) {
    static PlanOptions plan_opts;

    app->add_option("spec", plan_opts.spec_path, "Specification document")->required();

    app->callback([&opts]() { std::exit(cmd_plan(opts, plan_opts)); });
}

} // namespace strata::cli::commands
