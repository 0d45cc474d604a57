#include "strata/action.hpp"
#include "strata/materializer.hpp"
#include "strata/platform.hpp"
#include "strata/postcondition.hpp"

#include <spdlog/spdlog.h>

#include <cstdio>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace strata {

namespace {

ActionOutcome failed(FailureClass failure, std::string error) {
    ActionOutcome outcome;
    outcome.failure = failure;
    outcome.error = std::move(error);
    return outcome;
}

ActionOutcome succeeded(ResourceEffect effect) {
    ActionOutcome outcome;
    outcome.ok = true;
    outcome.effects.push_back(std::move(effect));
    return outcome;
}

ResourceEffect set_effect(const std::string& key, const std::string& value) {
    ResourceEffect effect;
    effect.op = EffectOp::Set;
    effect.key = key;
    effect.value = value;
    return effect;
}

std::string trim_output(const std::string& s) {
    size_t end = s.size();
    while (end > 0 && (s[end - 1] == '\n' || s[end - 1] == '\r' || s[end - 1] == ' ')) --end;
    return s.substr(0, end);
}

std::string last_line(const std::string& output) {
    std::string trimmed = trim_output(output);
    auto pos = trimmed.find_last_of('\n');
    return pos == std::string::npos ? trimmed : trimmed.substr(pos + 1);
}

std::string format_mode(fs::perms p) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "%04o", static_cast<unsigned>(p & fs::perms::mask));
    return buf;
}

} // namespace

std::string expand_command_template(const std::string& tmpl, const Step& step) {
    std::string out;
    size_t i = 0;
    while (i < tmpl.size()) {
        if (tmpl[i] == '{') {
            auto close = tmpl.find('}', i + 1);
            if (close != std::string::npos) {
                std::string name = tmpl.substr(i + 1, close - i - 1);
                if (step.has_param(name)) {
                    out += step.param(name);
                    i = close + 1;
                    continue;
                }
            }
        }
        out += tmpl[i];
        ++i;
    }
    return out;
}

std::string expected_resource_value(const Step& step) {
    switch (step.kind) {
        case ActionKind::InstallPackage:
            return step.param("version").empty() ? PRESENT_VALUE : step.param("version");
        case ActionKind::CreateInterpreterEnv:
            return step.param("python-version");
        case ActionKind::FetchArtifact:
            return expected_artifact_digest(step);
        case ActionKind::SetPermission:
            return normalize_mode(step.param("mode")).value_or("");
        case ActionKind::MutatePathVariable:
            return step.param("segment");
    }
    return "";
}

HostActionBackend::HostActionBackend(HostBackendOptions options)
    : options_(std::move(options)) {}

ActionOutcome HostActionBackend::apply(const Step& step, const ActionContext& ctx) {
    switch (step.kind) {
        case ActionKind::InstallPackage:
        case ActionKind::CreateInterpreterEnv:
            return run_command_action(step, ctx);
        case ActionKind::FetchArtifact:
            return fetch_artifact(step, ctx);
        case ActionKind::SetPermission:
            return set_permission(step);
        case ActionKind::MutatePathVariable:
            return mutate_path_variable(step);
    }
    return failed(FailureClass::NonTransient, "unsupported action kind");
}

// ============================================================================
// Command Actions
// ============================================================================

ActionOutcome HostActionBackend::run_command_action(const Step& step, const ActionContext& ctx) {
    std::string command;
    if (step.has_param("command")) {
        command = expand_command_template(step.param("command"), step);
    } else {
        auto it = options_.commands.find(step.kind);
        if (it == options_.commands.end() || it->second.empty()) {
            return failed(FailureClass::NonTransient,
                          std::string("no command configured for ") +
                              action_kind_to_string(step.kind));
        }
        command = expand_command_template(it->second, step);
    }

    spdlog::debug("[{}] running: {}", step.id, command);
    auto result = run_shell_command(command, options_.shell, ctx.timeout, ctx.cancel);

    if (result.timed_out) {
        return failed(FailureClass::Transient, "command " + result.error);
    }
    if (result.cancelled) {
        return failed(FailureClass::Transient, "command cancelled");
    }
    if (!result.ok) {
        return failed(FailureClass::NonTransient, result.error);
    }
    if (result.exit_code != 0) {
        FailureClass failure = options_.transient_exit_codes.count(result.exit_code)
                                   ? FailureClass::Transient
                                   : FailureClass::NonTransient;
        std::string message = "command exited with status " + std::to_string(result.exit_code);
        std::string tail = last_line(result.output);
        if (!tail.empty()) {
            message += ": " + tail;
        }
        return failed(failure, message);
    }

    return succeeded(set_effect(resource_key(step), expected_resource_value(step)));
}

// ============================================================================
// Artifacts
// ============================================================================

ActionOutcome HostActionBackend::fetch_artifact(const Step& step, const ActionContext& ctx) {
    auto ref = parse_artifact_reference(step.param("url"));
    if (ref.scheme == ArtifactScheme::Invalid) {
        return failed(FailureClass::NonTransient, ref.error);
    }

    FetchResult fetched = ref.scheme == ArtifactScheme::File
                              ? fetch_file(ref.location)
                              : fetch_https(ref.location, ctx.timeout, ctx.cancel);
    if (!fetched.ok) {
        return failed(fetched.transient ? FailureClass::Transient : FailureClass::NonTransient,
                      fetched.error);
    }

    std::string digest;
    std::string expected = expected_artifact_digest(step);
    if (!expected.empty()) {
        auto check = verify_sha256(fetched.data, expected);
        if (!check.ok) {
            return failed(FailureClass::NonTransient, check.error);
        }
        digest = check.actual;
    } else {
        auto hash = compute_sha256(fetched.data);
        if (!hash.ok) {
            return failed(FailureClass::NonTransient, hash.error);
        }
        digest = hash.hex;
    }

    auto written = atomic_write_file(step.param("dest"), fetched.data);
    if (!written.ok) {
        return failed(FailureClass::NonTransient, written.error);
    }

    spdlog::debug("[{}] wrote {} bytes to {}", step.id, fetched.data.size(), step.param("dest"));
    return succeeded(set_effect(resource_key(step), digest));
}

// ============================================================================
// Permissions
// ============================================================================

ActionOutcome HostActionBackend::set_permission(const Step& step) {
    auto mode = normalize_mode(step.param("mode"));
    if (!mode) {
        return failed(FailureClass::NonTransient, "invalid mode " + step.param("mode"));
    }

    std::string path = step.param("path");
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return failed(FailureClass::NonTransient, "no such file: " + path);
    }

    auto bits = static_cast<fs::perms>(std::stoul(*mode, nullptr, 8));
    fs::permissions(path, bits, fs::perm_options::replace, ec);
    if (ec) {
        return failed(FailureClass::NonTransient,
                      "failed to set mode " + *mode + " on " + path + ": " + ec.message());
    }

    return succeeded(set_effect(resource_key(step), *mode));
}

// ============================================================================
// Path Variables
// ============================================================================

ActionOutcome HostActionBackend::mutate_path_variable(const Step& step) {
    // The composed value lives in the snapshot; `strata env` exports it.
    ResourceEffect effect;
    effect.op = EffectOp::AppendSegment;
    effect.key = resource_key(step);
    effect.value = step.param("segment");
    effect.anchor = step.param("after");
    effect.separator = step_separator(step);
    return succeeded(std::move(effect));
}

// ============================================================================
// Live Probes
// ============================================================================

ProbeResult HostActionBackend::probe(const Step& step) {
    ProbeResult result;

    if (step.has_param("probe")) {
        result.observable = true;
        auto cmd = run_shell_command(expand_command_template(step.param("probe"), step),
                                     options_.shell, std::chrono::milliseconds(30000));
        if (!cmd.ok) {
            result.error = cmd.error;
        } else if (cmd.exit_code == 0) {
            result.value = last_line(cmd.output);
        }
        // Non-zero exit: resource absent
        return result;
    }

    switch (step.kind) {
        case ActionKind::FetchArtifact: {
            result.observable = true;
            std::string dest = step.param("dest");
            if (path_exists(dest)) {
                auto hash = compute_sha256(dest);
                if (hash.ok) {
                    result.value = hash.hex;
                } else {
                    result.error = hash.error;
                }
            }
            return result;
        }
        case ActionKind::SetPermission: {
            result.observable = true;
            std::error_code ec;
            auto status = fs::status(step.param("path"), ec);
            if (!ec && fs::exists(status)) {
                result.value = format_mode(status.permissions());
            }
            return result;
        }
        default:
            return result;
    }
}

} // namespace strata
