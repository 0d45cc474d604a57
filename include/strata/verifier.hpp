#pragma once

#include "strata/action.hpp"
#include "strata/snapshot.hpp"
#include "strata/types.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace strata {

// ============================================================================
// Verification Report
// ============================================================================

enum class VerificationStatus {
    Holds,
    DriftDetected,   // was applied or skipped, predicate no longer holds
    NeverAttempted,  // no record of the step ever running
    AttemptFailed,   // the last run recorded a failure for the step
};

inline const char* verification_status_to_string(VerificationStatus s) {
    switch (s) {
        case VerificationStatus::Holds: return "Holds";
        case VerificationStatus::DriftDetected: return "DriftDetected";
        case VerificationStatus::NeverAttempted: return "NeverAttempted";
        case VerificationStatus::AttemptFailed: return "AttemptFailed";
        default: return "Unknown";
    }
}

struct VerificationEntry {
    std::string step_id;
    std::string postcondition;
    bool holds = false;
    VerificationStatus status = VerificationStatus::NeverAttempted;
    std::string detail;
};

struct VerificationReport {
    std::vector<VerificationEntry> entries;  // same order as the input steps

    bool all_hold() const;
    size_t count(VerificationStatus status) const;
};

// Evaluate every step's postcondition against the snapshot. Never mutates
// state and never stops early. Snapshot provenance and recorded failures
// distinguish drift, failed attempts and steps that never ran.
VerificationReport verify(const std::vector<Step>& steps, const Snapshot& snapshot);

// As above, additionally using the results of a previous run
VerificationReport verify(const std::vector<Step>& steps, const Snapshot& snapshot,
                          const std::vector<StepResult>& results);

// Copy of `snapshot` with each observable step's resource re-read from the
// live system through the backend.
Snapshot observe_live_state(const std::vector<Step>& steps, const Snapshot& snapshot,
                            ActionBackend& backend);

} // namespace strata
