#pragma once

#include "strata/action.hpp"
#include "strata/graph.hpp"
#include "strata/process.hpp"
#include "strata/snapshot.hpp"
#include "strata/types.hpp"

#include <chrono>
#include <cstddef>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace strata {

// ============================================================================
// Executor Options
// ============================================================================

struct RetryPolicy {
    int max_retries = 3;  // additional attempts after the first
    std::chrono::milliseconds initial_backoff{200};
    double multiplier = 2.0;
    std::chrono::milliseconds max_backoff{5000};

    // Delay before retry number `retry` (1-based)
    std::chrono::milliseconds delay_for(int retry) const;
};

struct ExecutorOptions {
    RetryPolicy retry;

    // Worker threads; 1 runs steps one after another on the calling thread
    size_t parallel = 1;

    std::chrono::milliseconds default_timeout{300000};
    std::map<ActionKind, std::chrono::milliseconds> timeouts;

    // Only these kinds are retried on transient failure
    std::set<ActionKind> retry_kinds = {ActionKind::FetchArtifact, ActionKind::InstallPackage};

    const CancellationToken* cancel = nullptr;

    std::chrono::milliseconds timeout_for(ActionKind kind) const;
};

// ============================================================================
// Execution
// ============================================================================

struct ApplyResult {
    bool ok = false;
    ProvisionError error;           // first fatal error
    Snapshot snapshot;              // includes effects of every applied step
    std::vector<StepResult> results;  // plan order; undispatched steps omitted
    bool cancelled = false;
};

// Applies an execution plan against a snapshot. A step whose postcondition
// already holds is skipped. Otherwise the backend runs it, transient failures
// are retried per RetryPolicy, and the effects are merged only if the
// postcondition holds afterwards. The first failure halts the plan; effects
// of earlier steps are kept.
class Executor {
public:
    Executor(ActionBackend& backend, ExecutorOptions options = {});

    ApplyResult apply(const ExecutionPlan& plan, Snapshot snapshot);

    const ExecutorOptions& options() const { return options_; }

private:
    struct Attempt;

    ApplyResult apply_sequential(const ExecutionPlan& plan, Snapshot snapshot);
    ApplyResult apply_concurrent(const ExecutionPlan& plan, Snapshot snapshot);

    // Run the backend with retries; no snapshot access
    Attempt run_action(const Step& step);

    bool cancelled() const;

    ActionBackend& backend_;
    ExecutorOptions options_;
};

// ============================================================================
// Dry Run
// ============================================================================

struct PreviewEntry {
    std::string step_id;
    bool satisfied = false;
    std::string postcondition;
    std::string detail;
};

// Evaluate every step against the snapshot without touching the backend
std::vector<PreviewEntry> preview_plan(const ExecutionPlan& plan, const Snapshot& snapshot);

} // namespace strata
