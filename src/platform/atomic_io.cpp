#include "strata/platform.hpp"

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>

#ifdef _WIN32
#include <windows.h>
#else
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace strata {

namespace fs = std::filesystem;

namespace {

AtomicWriteResult write_failed(const std::string& what, const std::string& path) {
    AtomicWriteResult result;
    result.error = what + " " + path;
    if (errno != 0) {
        result.error += ": " + std::string(std::strerror(errno));
    }
    return result;
}

#ifndef _WIN32

bool sync_fd(int fd) {
#ifdef __APPLE__
    return fcntl(fd, F_FULLFSYNC, 0) == 0;
#else
    return fsync(fd) == 0;
#endif
}

// Best effort; the rename itself already happened
void sync_directory(const fs::path& dir) {
    int fd = open(dir.empty() ? "." : dir.c_str(), O_RDONLY);
    if (fd >= 0) {
        sync_fd(fd);
        close(fd);
    }
}

bool write_all(int fd, const uint8_t* data, size_t size) {
    while (size > 0) {
        ssize_t n = write(fd, data, size);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        data += n;
        size -= static_cast<size_t>(n);
    }
    return true;
}

#endif

} // namespace

// ============================================================================
// Atomic Writes
// ============================================================================

AtomicWriteResult atomic_write_file(const std::string& path, const std::string& content) {
    return atomic_write_file(path, std::vector<uint8_t>(content.begin(), content.end()));
}

AtomicWriteResult atomic_write_file(const std::string& path, const std::vector<uint8_t>& content) {
    fs::path target(path);
    fs::path dir = target.parent_path();

    std::error_code ec;
    if (!dir.empty()) {
        fs::create_directories(dir, ec);
        if (ec) {
            AtomicWriteResult result;
            result.error = "failed to create directory " + dir.string() + ": " + ec.message();
            return result;
        }
    }

    // Replacing a file keeps its permission bits
    auto existing = fs::status(target, ec);
    bool keep_mode = !ec && fs::is_regular_file(existing);

#ifdef _WIN32
    fs::path temp = target;
    temp += ".strata-tmp";
    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out) {
            return write_failed("failed to create temp file for", path);
        }
        out.write(reinterpret_cast<const char*>(content.data()),
                  static_cast<std::streamsize>(content.size()));
        if (!out.flush()) {
            out.close();
            fs::remove(temp, ec);
            return write_failed("failed to write", path);
        }
    }

    if (!MoveFileExA(temp.string().c_str(), path.c_str(),
                     MOVEFILE_REPLACE_EXISTING | MOVEFILE_WRITE_THROUGH)) {
        fs::remove(temp, ec);
        return write_failed("failed to replace", path);
    }
    if (keep_mode) {
        fs::permissions(target, existing.permissions(), fs::perm_options::replace, ec);
    }
#else
    std::string temp = (dir / ("." + target.filename().string() + ".strata-XXXXXX")).string();
    errno = 0;
    int fd = mkstemp(temp.data());
    if (fd < 0) {
        return write_failed("failed to create temp file for", path);
    }

    mode_t mode = keep_mode ? static_cast<mode_t>(existing.permissions() & fs::perms::mask)
                            : static_cast<mode_t>(0644);
    if (fchmod(fd, mode) != 0 || !write_all(fd, content.data(), content.size()) ||
        !sync_fd(fd)) {
        int saved = errno;
        close(fd);
        unlink(temp.c_str());
        errno = saved;
        return write_failed("failed to write", path);
    }
    close(fd);

    if (rename(temp.c_str(), path.c_str()) != 0) {
        int saved = errno;
        unlink(temp.c_str());
        errno = saved;
        return write_failed("failed to replace", path);
    }
    sync_directory(dir);
#endif

    AtomicWriteResult result;
    result.ok = true;
    return result;
}

std::optional<std::string> read_file(const std::string& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return std::nullopt;
    }
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::nullopt;
    }
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

bool path_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec);
}

char path_list_separator() {
#ifdef _WIN32
    return ';';
#else
    return ':';
#endif
}

// ============================================================================
// Environment
// ============================================================================

std::optional<std::string> get_env(const std::string& name) {
    const char* val = std::getenv(name.c_str());
    if (val == nullptr) {
        return std::nullopt;
    }
    return std::string(val);
}

std::string get_current_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto seconds = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                      now.time_since_epoch()).count() % 1000;

    std::tm utc{};
#ifdef _WIN32
    gmtime_s(&utc, &seconds);
#else
    gmtime_r(&seconds, &utc);
#endif

    char date[24];
    std::strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &utc);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%s.%03dZ", date, static_cast<int>(millis));
    return buf;
}

} // namespace strata
