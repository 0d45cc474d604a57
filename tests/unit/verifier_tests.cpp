#include <doctest/doctest.h>
#include <strata/executor.hpp>
#include <strata/graph.hpp>
#include <strata/verifier.hpp>

#include "../test_support.hpp"

using namespace strata;
using namespace strata::testing;

TEST_CASE("all steps hold after a matching snapshot") {
    std::vector<Step> steps = {
        package("numpy", "numpy", "1.26.4"),
        path_append("path", "PYTHONPATH", "/opt/teaser"),
    };
    Snapshot snap;
    snap.apply_step_effects("numpy", natural_outcome(steps[0]).effects);
    snap.apply_step_effects("path", natural_outcome(steps[1]).effects);

    auto report = verify(steps, snap);

    CHECK(report.all_hold());
    REQUIRE(report.entries.size() == 2);
    CHECK(report.entries[0].status == VerificationStatus::Holds);
    CHECK(report.entries[0].postcondition == "pkg:numpy == 1.26.4");
    CHECK(report.count(VerificationStatus::Holds) == 2);
}

TEST_CASE("verification reports every failing step without stopping") {
    std::vector<Step> steps = {
        package("a", "a", "1"),
        package("b", "b", "1"),
        package("c", "c", "1"),
    };
    Snapshot snap;
    snap.seed("pkg:b", "1");

    auto report = verify(steps, snap);

    CHECK_FALSE(report.all_hold());
    CHECK(report.count(VerificationStatus::NeverAttempted) == 2);
    CHECK(report.entries[1].holds);
    CHECK(report.entries[2].step_id == "c");
}

TEST_CASE("provenance separates drift from never attempted") {
    auto step = package("numpy", "numpy", "1.26.4");
    Snapshot snap;
    snap.apply_step_effects("numpy", natural_outcome(step).effects);
    snap.seed("pkg:numpy", "1.24.0");

    auto report = verify({step}, snap);
    REQUIRE(report.entries.size() == 1);
    CHECK(report.entries[0].status == VerificationStatus::DriftDetected);
    CHECK(report.entries[0].detail.find("DriftDetected: ") == 0);
    CHECK(report.entries[0].detail.find("1.24.0") != std::string::npos);

    auto fresh = verify({step}, Snapshot{});
    CHECK(fresh.entries[0].status == VerificationStatus::NeverAttempted);
}

TEST_CASE("previous run results refine the status") {
    std::vector<Step> steps = {
        package("broken", "b", "1"),
        package("skipped", "s", "1"),
    };

    StepResult failed;
    failed.step_id = "broken";
    failed.outcome = StepOutcome::Failed;
    failed.failure = ErrorKind::NonTransientActionError;

    StepResult skip;
    skip.step_id = "skipped";
    skip.outcome = StepOutcome::Skipped;

    auto report = verify(steps, Snapshot{}, {failed, skip});
    CHECK(report.entries[0].status == VerificationStatus::AttemptFailed);
    CHECK(report.entries[1].status == VerificationStatus::DriftDetected);
}

TEST_CASE("a step skipped in an earlier run shows drift once its resource is gone") {
    std::vector<Step> steps = {
        package("a", "numpy", "1.26"),
        package("b", "numpy", "1.26"),
    };
    auto planned = build_plan(steps);
    REQUIRE(planned.ok);

    ScriptedBackend backend;
    Executor executor(backend, ExecutorOptions{});
    auto run = executor.apply(planned.plan, Snapshot{});
    REQUIRE(run.ok);
    REQUIRE(run.results[1].outcome == StepOutcome::Skipped);

    Snapshot drifted = run.snapshot;
    drifted.forget("pkg:numpy");

    auto report = verify(steps, drifted);
    CHECK(report.entries[0].status == VerificationStatus::DriftDetected);
    CHECK(report.entries[1].status == VerificationStatus::DriftDetected);
}

TEST_CASE("a failure recorded by the last run is reported without run results") {
    std::vector<Step> steps = {
        package("numpy", "numpy", "1.26"),
        package("scipy", "scipy", "1.11", {"numpy"}),
    };
    auto planned = build_plan(steps);
    REQUIRE(planned.ok);

    ScriptedBackend backend;
    backend.script("numpy", {permanent_failure("exit status 1")});
    Executor executor(backend, ExecutorOptions{});
    auto run = executor.apply(planned.plan, Snapshot{});
    REQUIRE_FALSE(run.ok);

    auto report = verify(steps, run.snapshot);
    CHECK(report.entries[0].status == VerificationStatus::AttemptFailed);
    CHECK(report.entries[0].detail.find("exit status 1") != std::string::npos);
    CHECK(report.entries[1].status == VerificationStatus::NeverAttempted);

    // A later successful run clears the record
    auto rerun = executor.apply(planned.plan, run.snapshot);
    REQUIRE(rerun.ok);
    CHECK(verify(steps, rerun.snapshot).all_hold());
    CHECK(rerun.snapshot.failures().empty());
}

TEST_CASE("verify does not mutate the snapshot") {
    auto step = package("numpy", "numpy", "2.0");
    Snapshot snap;
    snap.seed("pkg:numpy", "1.0");
    Snapshot before = snap;

    verify({step}, snap);
    CHECK(snap == before);
}

// ============================================================================
// Live Observation
// ============================================================================

TEST_CASE("observe_live_state overlays probed values") {
    std::vector<Step> steps = {
        package("numpy", "numpy", "1.26.4"),
        package("scipy", "scipy", "1.11"),
        package("opaque", "opaque", "1"),
    };
    Snapshot recorded;
    for (const auto& step : steps) {
        recorded.apply_step_effects(step.id, natural_outcome(step).effects);
    }

    ScriptedBackend backend;
    backend.set_probe("numpy", std::string("1.25.0"));
    backend.set_probe("scipy", std::nullopt);

    auto live = observe_live_state(steps, recorded, backend);

    CHECK(live.get("pkg:numpy") == std::optional<std::string>("1.25.0"));
    CHECK_FALSE(live.contains("pkg:scipy"));
    CHECK(live.get("pkg:opaque") == std::optional<std::string>("1"));
    CHECK(live.revision() == recorded.revision());

    // The recorded snapshot is untouched
    CHECK(recorded.get("pkg:numpy") == std::optional<std::string>("1.26.4"));

    auto report = verify(steps, live);
    CHECK(report.entries[0].status == VerificationStatus::DriftDetected);
    CHECK(report.entries[1].status == VerificationStatus::DriftDetected);
    CHECK(report.entries[2].status == VerificationStatus::Holds);
}
