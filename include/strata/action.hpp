#pragma once

#include "strata/process.hpp"
#include "strata/snapshot.hpp"
#include "strata/types.hpp"

#include <chrono>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace strata {

// ============================================================================
// Action Outcomes
// ============================================================================

enum class FailureClass {
    None,
    Transient,      // timeout, connection reset, 5xx; may be retried
    NonTransient,   // checksum mismatch, permission denied, non-zero exit
};

struct ActionOutcome {
    bool ok = false;
    FailureClass failure = FailureClass::None;
    std::string error;
    std::vector<ResourceEffect> effects;
};

struct ActionContext {
    std::chrono::milliseconds timeout{std::chrono::milliseconds(300000)};
    const CancellationToken* cancel = nullptr;
};

struct ProbeResult {
    bool observable = false;            // false: no way to read live state
    std::optional<std::string> value;   // nullopt: resource absent
    std::string error;
};

// ============================================================================
// Backend Interface
// ============================================================================

// Performs the external side effect of a step and reports the resource
// effects it produced. Implementations must be safe to call from several
// worker threads at once for different steps.
class ActionBackend {
public:
    virtual ~ActionBackend() = default;

    virtual ActionOutcome apply(const Step& step, const ActionContext& ctx) = 0;

    // Read the live value of the step's resource key
    virtual ProbeResult probe(const Step& step) = 0;
};

// ============================================================================
// Host Backend
// ============================================================================

struct HostBackendOptions {
    std::string shell = "/bin/sh";

    // Command templates per kind, e.g.
    //   "install-package": "pip install {name}=={version}"
    // A step's own "command" param takes precedence.
    std::map<ActionKind, std::string> commands;

    // Exit statuses treated as transient failures
    std::set<int> transient_exit_codes = {75};
};

class HostActionBackend : public ActionBackend {
public:
    explicit HostActionBackend(HostBackendOptions options = {});

    ActionOutcome apply(const Step& step, const ActionContext& ctx) override;
    ProbeResult probe(const Step& step) override;

    const HostBackendOptions& options() const { return options_; }

private:
    ActionOutcome run_command_action(const Step& step, const ActionContext& ctx);
    ActionOutcome fetch_artifact(const Step& step, const ActionContext& ctx);
    ActionOutcome set_permission(const Step& step);
    ActionOutcome mutate_path_variable(const Step& step);

    HostBackendOptions options_;
};

// Substitute {param} placeholders with step parameter values. Unknown
// placeholders are left as-is.
std::string expand_command_template(const std::string& tmpl, const Step& step);

// Value recorded for a command-based step once it succeeds
std::string expected_resource_value(const Step& step);

} // namespace strata
