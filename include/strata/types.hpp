#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace strata {

// ============================================================================
// Action Kinds
// ============================================================================

enum class ActionKind {
    InstallPackage,
    CreateInterpreterEnv,
    MutatePathVariable,
    FetchArtifact,
    SetPermission,
};

// Canonical kebab-case name used in specification and config documents
inline const char* action_kind_to_string(ActionKind k) {
    switch (k) {
        case ActionKind::InstallPackage: return "install-package";
        case ActionKind::CreateInterpreterEnv: return "create-interpreter-env";
        case ActionKind::MutatePathVariable: return "mutate-path-variable";
        case ActionKind::FetchArtifact: return "fetch-artifact";
        case ActionKind::SetPermission: return "set-permission";
        default: return "unknown";
    }
}

std::optional<ActionKind> parse_action_kind(const std::string& s);

// All kinds in declaration order
std::vector<ActionKind> all_action_kinds();

// ============================================================================
// Step
// ============================================================================

using Parameters = std::map<std::string, std::string>;

struct Step {
    std::string id;
    ActionKind kind = ActionKind::InstallPackage;
    Parameters params;
    std::string postcondition;               // declared description, may be empty
    std::vector<std::string> prerequisites;  // "requires" in documents

    // Parameter lookup; empty string when absent
    std::string param(const std::string& key) const {
        auto it = params.find(key);
        return it != params.end() ? it->second : std::string();
    }

    bool has_param(const std::string& key) const {
        return params.find(key) != params.end();
    }
};

// ============================================================================
// Error Taxonomy
// ============================================================================

enum class ErrorKind {
    None,
    SpecParseError,
    DuplicateStepError,
    InvalidStepError,
    UnknownPrerequisiteError,
    CycleError,
    TransientActionError,
    NonTransientActionError,
    PostconditionNotMet,
    ConflictError,
    Cancelled,
    DriftDetected,
    SnapshotSchemaError,
};

inline const char* error_kind_to_string(ErrorKind e) {
    switch (e) {
        case ErrorKind::None: return "None";
        case ErrorKind::SpecParseError: return "SpecParseError";
        case ErrorKind::DuplicateStepError: return "DuplicateStepError";
        case ErrorKind::InvalidStepError: return "InvalidStepError";
        case ErrorKind::UnknownPrerequisiteError: return "UnknownPrerequisiteError";
        case ErrorKind::CycleError: return "CycleError";
        case ErrorKind::TransientActionError: return "TransientActionError";
        case ErrorKind::NonTransientActionError: return "NonTransientActionError";
        case ErrorKind::PostconditionNotMet: return "PostconditionNotMet";
        case ErrorKind::ConflictError: return "ConflictError";
        case ErrorKind::Cancelled: return "Cancelled";
        case ErrorKind::DriftDetected: return "DriftDetected";
        case ErrorKind::SnapshotSchemaError: return "SnapshotSchemaError";
        default: return "Unknown";
    }
}

// Errors detected before any step runs; the CLI maps these to exit code 2
bool is_specification_error(ErrorKind e);

struct ProvisionError {
    ErrorKind kind = ErrorKind::None;
    std::string message;
    std::vector<std::string> step_ids;  // offending steps; full path for cycles
    std::string relation;               // failing predicate or relation

    explicit operator bool() const { return kind != ErrorKind::None; }

    // "<Kind>: <message> [steps: a, b] (<relation>)"
    std::string to_string() const;
};

// ============================================================================
// Step Results
// ============================================================================

enum class StepOutcome {
    Applied,
    Skipped,
    Failed,
};

inline const char* step_outcome_to_string(StepOutcome o) {
    switch (o) {
        case StepOutcome::Applied: return "applied";
        case StepOutcome::Skipped: return "skipped";
        case StepOutcome::Failed: return "failed";
        default: return "unknown";
    }
}

struct StepResult {
    std::string step_id;
    StepOutcome outcome = StepOutcome::Skipped;
    ErrorKind failure = ErrorKind::None;  // set when outcome == Failed
    std::string reason;
    int attempts = 0;
};

// ============================================================================
// Resource Values
// ============================================================================

using ResourceMap = std::map<std::string, std::string>;

} // namespace strata
