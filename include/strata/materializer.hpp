#pragma once

#include "strata/process.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace strata {

// ============================================================================
// Artifact References
// ============================================================================
//
// The "url" parameter of a fetch-artifact step:
//
//   file:<path>                 local file, absolute or relative
//   file:///<absolute path>     same, URL form
//   https://host/path           remote file over TLS
//
// Either form may carry a "#sha256=<64 hex>" fragment with the expected
// digest of the content.

enum class ArtifactScheme {
    File,
    Https,
    Invalid,
};

struct ArtifactReference {
    ArtifactScheme scheme = ArtifactScheme::Invalid;
    std::string location;  // path for File, URL without fragment for Https
    std::string sha256;    // lowercase digest from the fragment, may be empty
    std::string error;     // set when scheme is Invalid
};

ArtifactReference parse_artifact_reference(const std::string& reference);

// True for exactly 64 hex characters (either case)
bool is_sha256_hex(const std::string& s);

// ============================================================================
// SHA-256
// ============================================================================

struct DigestResult {
    bool ok = false;
    std::string error;
    std::string hex;  // lowercase, 64 characters
};

DigestResult compute_sha256(const std::vector<uint8_t>& data);
DigestResult compute_sha256(const std::string& file_path);

struct DigestCheck {
    bool ok = false;
    std::string error;
    std::string actual;  // digest of the data, set whenever hashing worked
};

// Compare the digest of `data` against `expected_hex`, ignoring case
DigestCheck verify_sha256(const std::vector<uint8_t>& data, const std::string& expected_hex);

// ============================================================================
// Fetching
// ============================================================================

struct FetchResult {
    bool ok = false;
    bool transient = false;  // timeout, refused connection, 408/429/5xx
    bool cancelled = false;
    std::string error;
    std::vector<uint8_t> data;
    long http_status = 0;
};

// Download over HTTPS with certificate verification and redirects. The whole
// transfer is bounded by `timeout`; a cancelled token aborts it.
FetchResult fetch_https(const std::string& url, std::chrono::milliseconds timeout,
                        const CancellationToken* cancel = nullptr);

FetchResult fetch_file(const std::string& path);

} // namespace strata
