#pragma once

#include "strata/types.hpp"

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace strata {

// ============================================================================
// Execution Plan
// ============================================================================

struct PlannedStep {
    Step step;
    size_t declaration_index = 0;
    std::vector<size_t> prerequisites;  // positions in ExecutionPlan::entries
};

// Topological order of a step set; ties broken by declaration index.
struct ExecutionPlan {
    std::vector<PlannedStep> entries;

    std::vector<std::string> order() const;
    bool empty() const { return entries.empty(); }
    size_t size() const { return entries.size(); }
};

// ============================================================================
// Dependency Graph
// ============================================================================

struct GraphResult;

class DependencyGraph {
public:
    struct Node {
        std::string id;
        std::vector<size_t> prerequisites;  // declaration indices
        std::vector<size_t> dependents;     // declaration indices
    };

    // Validate ids and prerequisites, reject cycles. Fails with
    // DuplicateStepError, UnknownPrerequisiteError or CycleError; the
    // CycleError carries the full cycle path, first node repeated at the end.
    static GraphResult build(const std::vector<Step>& steps);

    const std::vector<Node>& nodes() const { return nodes_; }
    const std::vector<Step>& steps() const { return steps_; }

    ExecutionPlan plan() const;

private:
    std::vector<Step> steps_;
    std::vector<Node> nodes_;
    std::unordered_map<std::string, size_t> index_;
    std::vector<size_t> topo_order_;
};

struct GraphResult {
    bool ok = false;
    ProvisionError error;
    DependencyGraph graph;
};

// Convenience: build the graph and return its plan
struct PlanResult {
    bool ok = false;
    ProvisionError error;
    ExecutionPlan plan;
};

PlanResult build_plan(const std::vector<Step>& steps);

} // namespace strata
