/**
 * strata CLI - Common utilities and types
 */

#pragma once

#include "strata/engine_config.hpp"
#include "strata/graph.hpp"
#include "strata/process.hpp"
#include "strata/spec_document.hpp"
#include "strata/types.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#ifndef _WIN32
#include <signal.h>
#endif

namespace strata::cli {

constexpr int EXIT_OK = 0;
constexpr int EXIT_FAILED = 1;
constexpr int EXIT_MALFORMED_SPEC = 2;

constexpr const char* DEFAULT_SNAPSHOT_PATH = "strata.snapshot.json";

// Flags shared by every subcommand
struct GlobalOptions {
    std::string config;
    std::string log_file;
    bool json = false;
    bool verbose = false;  // debug logging, overrides the config log_level
    bool quiet = false;    // errors only
};

// Warnings raised while a command runs. In --json mode they are attached to
// the result object under "warnings"; otherwise they go to the log.
class Diagnostics {
public:
    void reset(bool json_mode) {
        json_mode_ = json_mode;
        collected_.clear();
    }

    void warn(const std::string& msg) {
        if (json_mode_) {
            collected_.push_back(msg);
        } else {
            spdlog::warn("{}", msg);
        }
    }

    void attach_to(nlohmann::json& j) const {
        if (!collected_.empty() && !j.contains("warnings")) {
            j["warnings"] = collected_;
        }
    }

private:
    bool json_mode_ = false;
    std::vector<std::string> collected_;
};

inline Diagnostics& diagnostics() {
    static Diagnostics instance;
    return instance;
}

inline nlohmann::json error_to_json(const ProvisionError& error) {
    nlohmann::json j = {
        {"kind", error_kind_to_string(error.kind)},
        {"message", error.message},
        {"step_ids", error.step_ids},
    };
    if (!error.relation.empty()) {
        j["relation"] = error.relation;
    }
    return j;
}

inline void emit_json(nlohmann::json j) {
    diagnostics().attach_to(j);
    std::cout << j.dump(2) << '\n';
}

inline void report_error(const std::string& msg, bool json_mode) {
    if (json_mode) {
        emit_json({{"ok", false}, {"error", msg}});
    } else {
        spdlog::error("{}", msg);
    }
}

inline void report_error(const ProvisionError& error, bool json_mode) {
    if (json_mode) {
        emit_json({{"ok", false}, {"error", error_to_json(error)}});
    } else {
        spdlog::error("{}", error.to_string());
    }
}

inline int exit_code_for(const ProvisionError& error) {
    return is_specification_error(error.kind) ? EXIT_MALFORMED_SPEC : EXIT_FAILED;
}

// Console logger used until the configuration has been read
inline void init_console_logging() {
    auto logger = spdlog::stderr_color_mt("strata");
    logger->set_pattern("%^%l%$: %v");
    spdlog::set_default_logger(logger);
}

/**
 * Configure the default spdlog logger: stderr console sink, plus a file sink
 * for --log-file. -v and -q take precedence over the config log_level.
 */
inline bool setup_logging(const GlobalOptions& opts, const std::string& config_level) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    if (!opts.log_file.empty()) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(opts.log_file));
        } catch (const spdlog::spdlog_ex& e) {
            report_error(std::string("cannot open log file: ") + e.what(), opts.json);
            return false;
        }
    }

    auto logger = std::make_shared<spdlog::logger>("strata", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);

    auto level = opts.verbose ? spdlog::level::debug
                 : opts.quiet ? spdlog::level::err
                              : spdlog::level::from_str(config_level);
    spdlog::set_level(level);
    spdlog::set_pattern(opts.verbose ? "[%T.%e] [%^%l%$] %v" : "%^%l%$: %v");
    return true;
}

/**
 * Resolve and load the engine configuration, then start logging.
 * Priority: --config flag > STRATA_CONFIG env > built-in defaults
 */
inline bool load_config_and_logging(const GlobalOptions& opts, EngineConfig& out) {
    diagnostics().reset(opts.json);

    out = get_default_config();
    std::vector<std::string> config_warnings;
    if (auto path = resolve_config_path(opts.config)) {
        auto loaded = load_engine_config(*path);
        if (!loaded.ok) {
            report_error(*path + ": " + loaded.error, opts.json);
            return false;
        }
        for (const auto& w : loaded.warnings) {
            config_warnings.push_back(*path + ": " + w);
        }
        out = loaded.config;
    }

    // The config decides the log level, so its warnings wait for the logger
    if (!setup_logging(opts, out.log_level)) {
        return false;
    }
    for (const auto& w : config_warnings) {
        diagnostics().warn(w);
    }
    if (!out.source_path.empty()) {
        spdlog::debug("using config {}", out.source_path);
    }
    return true;
}

/**
 * Load a specification and order it. On failure the error is printed and
 * the exit code is returned through `exit_code`.
 */
inline bool load_spec_and_plan(const std::string& path, const GlobalOptions& opts,
                               ProvisionSpec& spec, ExecutionPlan& plan, int& exit_code) {
    auto parsed = load_spec(path);
    for (const auto& w : parsed.warnings) {
        diagnostics().warn(path + ": " + w);
    }
    if (!parsed.ok) {
        report_error(parsed.error, opts.json);
        exit_code = exit_code_for(parsed.error);
        return false;
    }

    auto planned = build_plan(parsed.spec.steps);
    if (!planned.ok) {
        report_error(planned.error, opts.json);
        exit_code = exit_code_for(planned.error);
        return false;
    }

    spec = std::move(parsed.spec);
    plan = std::move(planned.plan);
    spdlog::debug("planned {} step(s) from {}", plan.size(), path);
    return true;
}

// ============================================================================
// Interruption
// ============================================================================

inline volatile std::sig_atomic_t interrupt_signal = 0;

// First SIGINT/SIGTERM requests cancellation, a second one exits at once
inline void handle_interrupt(int sig) {
    if (interrupt_signal != 0) {
        std::_Exit(128 + sig);
    }
    interrupt_signal = sig;
}

/**
 * Installs the interrupt handler for the lifetime of a run and forwards the
 * signal to a CancellationToken from a watcher thread. Running commands are
 * killed, no further steps start, and the caller still saves the snapshot.
 */
class InterruptWatcher {
public:
    explicit InterruptWatcher(CancellationToken& token) : token_(token) {
#ifdef _WIN32
        std::signal(SIGINT, handle_interrupt);
        std::signal(SIGTERM, handle_interrupt);
#else
        struct sigaction sa {};
        sa.sa_handler = handle_interrupt;
        sigemptyset(&sa.sa_mask);
        sigaction(SIGINT, &sa, nullptr);
        sigaction(SIGTERM, &sa, nullptr);
#endif
        thread_ = std::thread([this] { watch(); });
    }

    ~InterruptWatcher() {
        done_.store(true);
        thread_.join();
    }

    InterruptWatcher(const InterruptWatcher&) = delete;
    InterruptWatcher& operator=(const InterruptWatcher&) = delete;

private:
    void watch() {
        while (!done_.load()) {
            if (interrupt_signal != 0) {
                spdlog::warn("interrupted (signal {}), finishing running steps",
                             static_cast<int>(interrupt_signal));
                token_.cancel();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    }

    CancellationToken& token_;
    std::atomic<bool> done_{false};
    std::thread thread_;
};

} // namespace strata::cli
