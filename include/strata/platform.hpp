#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace strata {

// ============================================================================
// Atomic File Operations
// ============================================================================

struct AtomicWriteResult {
    bool ok = false;
    std::string error;
};

// Write content atomically: temp file beside the target, fsync, rename,
// fsync of the directory. Missing parent directories are created and an
// existing file keeps its permission bits.
AtomicWriteResult atomic_write_file(const std::string& path, const std::string& content);
AtomicWriteResult atomic_write_file(const std::string& path, const std::vector<uint8_t>& content);

// Read a whole regular file; nullopt otherwise
std::optional<std::string> read_file(const std::string& path);

bool path_exists(const std::string& path);

// Separator for PATH-like variables: ':' on POSIX, ';' on Windows
char path_list_separator();

// ============================================================================
// Environment
// ============================================================================

std::optional<std::string> get_env(const std::string& name);

// UTC time as RFC3339 with milliseconds, e.g. 2024-05-01T12:00:00.123Z
std::string get_current_timestamp();

} // namespace strata
