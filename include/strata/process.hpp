#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>

namespace strata {

// ============================================================================
// Cancellation
// ============================================================================

// Run-level cancellation signal shared by the executor, backoff waits and
// running commands.
class CancellationToken {
public:
    void cancel();
    bool is_cancelled() const { return cancelled_.load(); }

    // Sleep for up to `duration`; returns true if cancelled meanwhile.
    bool wait_for(std::chrono::milliseconds duration) const;

private:
    std::atomic<bool> cancelled_{false};
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
};

// ============================================================================
// Shell Commands
// ============================================================================

struct CommandResult {
    bool ok = false;          // process ran and was reaped
    int exit_code = -1;
    bool timed_out = false;
    bool cancelled = false;
    std::string output;       // combined stdout and stderr
    std::string error;        // spawn or wait failure
};

// Run `shell -c command`, capturing output. The process is killed when the
// timeout expires or the token is cancelled.
CommandResult run_shell_command(const std::string& command,
                                const std::string& shell,
                                std::chrono::milliseconds timeout,
                                const CancellationToken* cancel = nullptr);

} // namespace strata
