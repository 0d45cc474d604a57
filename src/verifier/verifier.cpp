#include "strata/verifier.hpp"
#include "strata/postcondition.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <map>

namespace strata {

bool VerificationReport::all_hold() const {
    return std::all_of(entries.begin(), entries.end(),
                       [](const VerificationEntry& e) { return e.holds; });
}

size_t VerificationReport::count(VerificationStatus status) const {
    return static_cast<size_t>(std::count_if(
        entries.begin(), entries.end(),
        [status](const VerificationEntry& e) { return e.status == status; }));
}

VerificationReport verify(const std::vector<Step>& steps, const Snapshot& snapshot) {
    return verify(steps, snapshot, {});
}

VerificationReport verify(const std::vector<Step>& steps, const Snapshot& snapshot,
                          const std::vector<StepResult>& results) {
    std::map<std::string, StepOutcome> outcomes;
    for (const auto& r : results) {
        outcomes[r.step_id] = r.outcome;
    }

    VerificationReport report;
    for (const auto& step : steps) {
        VerificationEntry entry;
        entry.step_id = step.id;
        entry.postcondition = describe_postcondition(step);

        auto check = evaluate_postcondition(step, snapshot);
        entry.holds = check.holds;

        if (check.holds) {
            entry.status = VerificationStatus::Holds;
            entry.detail = check.detail;
        } else {
            auto it = outcomes.find(step.id);
            auto recorded_failure = snapshot.last_failure(step.id);
            if (it != outcomes.end()) {
                entry.status = it->second == StepOutcome::Failed
                                   ? VerificationStatus::AttemptFailed
                                   : VerificationStatus::DriftDetected;
            } else if (recorded_failure) {
                entry.status = VerificationStatus::AttemptFailed;
            } else if (snapshot.was_applied(step.id)) {
                entry.status = VerificationStatus::DriftDetected;
            } else {
                entry.status = VerificationStatus::NeverAttempted;
            }
            entry.detail = std::string(verification_status_to_string(entry.status)) + ": " +
                           check.detail;
            if (entry.status == VerificationStatus::AttemptFailed && recorded_failure &&
                it == outcomes.end()) {
                entry.detail += " (last run: " + *recorded_failure + ")";
            }
            spdlog::debug("[{}] {}", step.id, entry.detail);
        }

        report.entries.push_back(std::move(entry));
    }
    return report;
}

Snapshot observe_live_state(const std::vector<Step>& steps, const Snapshot& snapshot,
                            ActionBackend& backend) {
    Snapshot observed = snapshot;
    for (const auto& step : steps) {
        auto probe = backend.probe(step);
        if (!probe.observable) {
            continue;
        }
        if (!probe.error.empty()) {
            spdlog::warn("[{}] live probe failed: {}", step.id, probe.error);
            continue;
        }

        std::string key = resource_key(step);
        if (probe.value) {
            observed.seed(key, *probe.value);
        } else {
            observed.forget(key);
        }
    }
    return observed;
}

} // namespace strata
