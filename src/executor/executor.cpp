#include "strata/executor.hpp"
#include "strata/postcondition.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <thread>

namespace strata {

std::chrono::milliseconds RetryPolicy::delay_for(int retry) const {
    double ms = static_cast<double>(initial_backoff.count()) *
                std::pow(multiplier, std::max(0, retry - 1));
    double cap = static_cast<double>(max_backoff.count());
    return std::chrono::milliseconds(static_cast<long long>(std::min(ms, cap)));
}

std::chrono::milliseconds ExecutorOptions::timeout_for(ActionKind kind) const {
    auto it = timeouts.find(kind);
    return it != timeouts.end() ? it->second : default_timeout;
}

struct Executor::Attempt {
    ActionOutcome outcome;
    int attempts = 0;
    bool cancelled = false;
};

namespace {

StepResult skipped(const Step& step, const std::string& detail) {
    StepResult r;
    r.step_id = step.id;
    r.outcome = StepOutcome::Skipped;
    r.reason = detail;
    return r;
}

ProvisionError step_error(ErrorKind kind, const Step& step, std::string message) {
    ProvisionError error;
    error.kind = kind;
    error.message = std::move(message);
    error.step_ids = {step.id};
    error.relation = describe_postcondition(step);
    return error;
}

StepResult failed_result(const Step& step, const ProvisionError& error, int attempts) {
    StepResult r;
    r.step_id = step.id;
    r.outcome = StepOutcome::Failed;
    r.failure = error.kind;
    r.reason = error.message;
    r.attempts = attempts;
    return r;
}

// Translate a finished backend attempt into an error, or None on success
ProvisionError classify(const Step& step, const ActionOutcome& outcome, int attempts,
                        bool cancelled) {
    if (outcome.ok) {
        return {};
    }
    if (cancelled) {
        return step_error(ErrorKind::Cancelled, step,
                          "step " + step.id + " cancelled: " + outcome.error);
    }
    if (outcome.failure == FailureClass::Transient) {
        return step_error(ErrorKind::TransientActionError, step,
                          "step " + step.id + " failed after " + std::to_string(attempts) +
                              " attempt(s): " + outcome.error);
    }
    return step_error(ErrorKind::NonTransientActionError, step,
                      "step " + step.id + " failed: " + outcome.error);
}

// Merge effects into a copy; on success `snapshot` takes the copy
std::optional<ProvisionError> commit_effects(const Step& step, const ActionOutcome& outcome,
                                             Snapshot& snapshot) {
    Snapshot staged = snapshot;
    staged.apply_step_effects(step.id, outcome.effects);

    auto check = evaluate_postcondition(step, staged);
    if (!check.holds) {
        return step_error(ErrorKind::PostconditionNotMet, step,
                          "step " + step.id + " succeeded but " + describe_postcondition(step) +
                              " does not hold: " + check.detail);
    }
    snapshot = std::move(staged);
    return std::nullopt;
}

StepResult applied(const Step& step, int attempts) {
    StepResult r;
    r.step_id = step.id;
    r.outcome = StepOutcome::Applied;
    r.reason = describe_postcondition(step);
    r.attempts = attempts;
    return r;
}

} // namespace

Executor::Executor(ActionBackend& backend, ExecutorOptions options)
    : backend_(backend), options_(std::move(options)) {}

bool Executor::cancelled() const {
    return options_.cancel != nullptr && options_.cancel->is_cancelled();
}

Executor::Attempt Executor::run_action(const Step& step) {
    Attempt attempt;
    ActionContext ctx;
    ctx.timeout = options_.timeout_for(step.kind);
    ctx.cancel = options_.cancel;

    bool retryable = options_.retry_kinds.count(step.kind) > 0;

    while (true) {
        attempt.outcome = backend_.apply(step, ctx);
        attempt.attempts++;

        if (attempt.outcome.ok) {
            return attempt;
        }
        if (cancelled()) {
            attempt.cancelled = true;
            return attempt;
        }
        if (attempt.outcome.failure != FailureClass::Transient || !retryable ||
            attempt.attempts > options_.retry.max_retries) {
            return attempt;
        }

        auto delay = options_.retry.delay_for(attempt.attempts);
        spdlog::warn("[{}] transient failure (attempt {}/{}): {}; retrying in {}ms", step.id,
                     attempt.attempts, options_.retry.max_retries + 1, attempt.outcome.error,
                     delay.count());

        if (options_.cancel == nullptr) {
            std::this_thread::sleep_for(delay);
        } else if (options_.cancel->wait_for(delay)) {
            attempt.cancelled = true;
            return attempt;
        }
    }
}

ApplyResult Executor::apply(const ExecutionPlan& plan, Snapshot snapshot) {
    spdlog::debug("applying {} step(s) with {} worker(s)", plan.size(),
                  std::max<size_t>(options_.parallel, 1));
    if (options_.parallel <= 1 || plan.size() <= 1) {
        return apply_sequential(plan, std::move(snapshot));
    }
    return apply_concurrent(plan, std::move(snapshot));
}

// ============================================================================
// Sequential
// ============================================================================

ApplyResult Executor::apply_sequential(const ExecutionPlan& plan, Snapshot snapshot) {
    ApplyResult result;
    result.snapshot = std::move(snapshot);

    for (size_t pos = 0; pos < plan.entries.size(); ++pos) {
        const Step& step = plan.entries[pos].step;

        if (cancelled()) {
            result.cancelled = true;
            result.error.kind = ErrorKind::Cancelled;
            result.error.message = "run cancelled before step " + step.id;
            result.error.step_ids = {step.id};
            spdlog::warn("{}", result.error.message);
            return result;
        }

        auto check = evaluate_postcondition(step, result.snapshot);
        if (check.holds) {
            spdlog::debug("[{}] skipped: {}", step.id, check.detail);
            result.snapshot.mark_satisfied(step.id);
            result.results.push_back(skipped(step, check.detail));
            continue;
        }

        Attempt attempt = run_action(step);
        ProvisionError error = classify(step, attempt.outcome, attempt.attempts, attempt.cancelled);
        if (!error) {
            if (auto not_met = commit_effects(step, attempt.outcome, result.snapshot)) {
                error = *not_met;
            }
        }

        if (error) {
            spdlog::error("{}", error.to_string());
            result.snapshot.record_failure(step.id, error.to_string());
            result.results.push_back(failed_result(step, error, attempt.attempts));
            result.cancelled = error.kind == ErrorKind::Cancelled;
            result.error = error;
            return result;
        }

        spdlog::info("[{}] applied: {}", step.id, describe_postcondition(step));
        result.results.push_back(applied(step, attempt.attempts));
    }

    result.ok = true;
    return result;
}

// ============================================================================
// Concurrent
// ============================================================================

ApplyResult Executor::apply_concurrent(const ExecutionPlan& plan, Snapshot snapshot) {
    enum class State { Pending, Running, Done, Failed };

    const size_t total = plan.entries.size();
    std::vector<State> state(total, State::Pending);
    std::vector<size_t> waiting(total, 0);
    std::vector<std::vector<size_t>> dependents(total);
    std::vector<std::string> keys(total);
    std::vector<std::optional<StepResult>> results(total);

    for (size_t i = 0; i < total; ++i) {
        keys[i] = resource_key(plan.entries[i].step);
        waiting[i] = plan.entries[i].prerequisites.size();
        for (size_t pre : plan.entries[i].prerequisites) {
            dependents[pre].push_back(i);
        }
    }

    std::mutex mtx;
    std::condition_variable cv;
    std::map<std::string, size_t> held;  // resource key -> running entry
    size_t running = 0;
    size_t settled = 0;
    bool halted = false;
    bool was_cancelled = false;
    ProvisionError first_error;

    // Lowest plan position that may start now. Same-key entries run in plan
    // order, so an entry waits for every earlier unfinished entry on its key.
    auto next_ready = [&]() -> std::optional<size_t> {
        for (size_t i = 0; i < total; ++i) {
            if (state[i] != State::Pending || waiting[i] != 0) continue;
            if (held.count(keys[i])) continue;
            bool blocked = false;
            for (size_t j = 0; j < i && !blocked; ++j) {
                blocked = keys[j] == keys[i] && state[j] == State::Pending;
            }
            if (!blocked) return i;
        }
        return std::nullopt;
    };

    auto finish = [&](size_t i, StepResult r, const ProvisionError& error) {
        held.erase(keys[i]);
        --running;
        ++settled;
        results[i] = std::move(r);
        if (error) {
            state[i] = State::Failed;
            if (!first_error) first_error = error;
            if (error.kind == ErrorKind::Cancelled) was_cancelled = true;
            halted = true;
        } else {
            state[i] = State::Done;
            for (size_t d : dependents[i]) --waiting[d];
        }
        cv.notify_all();
    };

    auto worker = [&]() {
        while (true) {
            size_t i;
            {
                std::unique_lock<std::mutex> lock(mtx);
                std::optional<size_t> ready;
                while (true) {
                    if (!halted && cancelled()) {
                        halted = true;
                        was_cancelled = true;
                        cv.notify_all();
                    }
                    if (halted || settled == total) return;
                    ready = next_ready();
                    if (ready) break;
                    if (running == 0) {
                        // Nothing in flight and nothing startable
                        halted = true;
                        cv.notify_all();
                        return;
                    }
                    cv.wait_for(lock, std::chrono::milliseconds(50));
                }

                i = *ready;
                const Step& step = plan.entries[i].step;
                state[i] = State::Running;
                held[keys[i]] = i;
                ++running;

                auto check = evaluate_postcondition(step, snapshot);
                if (check.holds) {
                    spdlog::debug("[{}] skipped: {}", step.id, check.detail);
                    snapshot.mark_satisfied(step.id);
                    finish(i, skipped(step, check.detail), {});
                    continue;
                }
            }

            const Step& step = plan.entries[i].step;
            Attempt attempt = run_action(step);

            std::lock_guard<std::mutex> lock(mtx);
            ProvisionError error =
                classify(step, attempt.outcome, attempt.attempts, attempt.cancelled);

            if (!error) {
                for (const auto& effect : attempt.outcome.effects) {
                    if (effect.key == keys[i]) continue;
                    auto owner = held.find(effect.key);
                    if (owner != held.end() && owner->second != i) {
                        error = step_error(ErrorKind::ConflictError, step,
                                           "step " + step.id + " wrote " + effect.key +
                                               " while step " +
                                               plan.entries[owner->second].step.id +
                                               " holds it");
                        error.step_ids.push_back(plan.entries[owner->second].step.id);
                        break;
                    }
                }
            }

            if (!error) {
                if (auto not_met = commit_effects(step, attempt.outcome, snapshot)) {
                    error = *not_met;
                }
            }

            if (error) {
                spdlog::error("{}", error.to_string());
                snapshot.record_failure(step.id, error.to_string());
                finish(i, failed_result(step, error, attempt.attempts), error);
            } else {
                spdlog::info("[{}] applied: {}", step.id, describe_postcondition(step));
                finish(i, applied(step, attempt.attempts), {});
            }
        }
    };

    size_t thread_count = std::min(options_.parallel, total);
    std::vector<std::thread> pool;
    pool.reserve(thread_count);
    for (size_t t = 0; t < thread_count; ++t) {
        pool.emplace_back(worker);
    }
    for (auto& thread : pool) {
        thread.join();
    }

    ApplyResult result;
    result.snapshot = std::move(snapshot);
    for (auto& r : results) {
        if (r) result.results.push_back(std::move(*r));
    }
    result.cancelled = was_cancelled;

    if (first_error) {
        result.error = first_error;
    } else if (was_cancelled) {
        result.error.kind = ErrorKind::Cancelled;
        result.error.message = "run cancelled with " + std::to_string(total - settled) +
                               " step(s) not dispatched";
        spdlog::warn("{}", result.error.message);
    }
    result.ok = !result.error && settled == total;
    return result;
}

// ============================================================================
// Dry Run
// ============================================================================

std::vector<PreviewEntry> preview_plan(const ExecutionPlan& plan, const Snapshot& snapshot) {
    std::vector<PreviewEntry> entries;
    entries.reserve(plan.entries.size());
    for (const auto& planned : plan.entries) {
        auto check = evaluate_postcondition(planned.step, snapshot);
        PreviewEntry entry;
        entry.step_id = planned.step.id;
        entry.satisfied = check.holds;
        entry.postcondition = describe_postcondition(planned.step);
        entry.detail = check.detail;
        entries.push_back(std::move(entry));
    }
    return entries;
}

} // namespace strata
