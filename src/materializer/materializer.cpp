#include "strata/materializer.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <iterator>
#include <system_error>

#include <curl/curl.h>
#include <openssl/evp.h>

namespace strata {

namespace fs = std::filesystem;

namespace {

constexpr const char* DIGEST_FRAGMENT = "sha256=";

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool starts_with(const std::string& s, const char* prefix) {
    return s.rfind(prefix, 0) == 0;
}

ArtifactReference invalid_reference(std::string error) {
    ArtifactReference ref;
    ref.error = std::move(error);
    return ref;
}

} // namespace

// ============================================================================
// Artifact References
// ============================================================================

bool is_sha256_hex(const std::string& s) {
    return s.size() == 64 && std::all_of(s.begin(), s.end(), [](unsigned char c) {
               return std::isxdigit(c) != 0;
           });
}

ArtifactReference parse_artifact_reference(const std::string& reference) {
    if (reference.empty()) {
        return invalid_reference("empty reference");
    }

    std::string body = reference;
    std::string digest;
    auto hash = reference.find('#');
    if (hash != std::string::npos) {
        body = reference.substr(0, hash);
        std::string fragment = reference.substr(hash + 1);
        if (!starts_with(fragment, DIGEST_FRAGMENT)) {
            return invalid_reference("fragment must be sha256=<hex>, got: " + fragment);
        }
        digest = fragment.substr(std::char_traits<char>::length(DIGEST_FRAGMENT));
        if (!is_sha256_hex(digest)) {
            return invalid_reference("sha256 fragment must be 64 hex characters");
        }
    }

    ArtifactReference ref;
    ref.sha256 = lowercase(digest);

    if (starts_with(body, "file://")) {
        ref.scheme = ArtifactScheme::File;
        ref.location = body.substr(7);
    } else if (starts_with(body, "file:")) {
        ref.scheme = ArtifactScheme::File;
        ref.location = body.substr(5);
    } else if (starts_with(body, "https://")) {
        ref.scheme = ArtifactScheme::Https;
        ref.location = body;
        if (body.size() == 8) {
            return invalid_reference("https reference without host");
        }
    } else if (starts_with(body, "http://")) {
        return invalid_reference("plain HTTP is not allowed, use HTTPS");
    } else {
        return invalid_reference("unsupported scheme in '" + reference +
                                 "', expected file: or https://");
    }

    if (ref.location.empty()) {
        return invalid_reference("empty file path");
    }
    return ref;
}

// ============================================================================
// SHA-256
// ============================================================================

namespace {

// Incremental SHA-256 over an OpenSSL EVP context
class Sha256 {
public:
    Sha256() : ctx_(EVP_MD_CTX_new()) {
        if (ctx_ == nullptr) {
            error_ = "EVP_MD_CTX_new failed";
        } else if (EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1) {
            error_ = "EVP_DigestInit_ex failed";
        }
    }

    ~Sha256() {
        if (ctx_) EVP_MD_CTX_free(ctx_);
    }

    Sha256(const Sha256&) = delete;
    Sha256& operator=(const Sha256&) = delete;

    void update(const void* data, size_t size) {
        if (error_.empty() && EVP_DigestUpdate(ctx_, data, size) != 1) {
            error_ = "EVP_DigestUpdate failed";
        }
    }

    DigestResult finish() {
        DigestResult result;
        unsigned char md[EVP_MAX_MD_SIZE];
        unsigned int len = 0;
        if (error_.empty() && EVP_DigestFinal_ex(ctx_, md, &len) != 1) {
            error_ = "EVP_DigestFinal_ex failed";
        }
        if (!error_.empty()) {
            result.error = error_;
            return result;
        }

        static const char digits[] = "0123456789abcdef";
        result.hex.reserve(len * 2);
        for (unsigned int i = 0; i < len; ++i) {
            result.hex.push_back(digits[md[i] >> 4]);
            result.hex.push_back(digits[md[i] & 0x0F]);
        }
        result.ok = true;
        return result;
    }

private:
    EVP_MD_CTX* ctx_;
    std::string error_;
};

} // namespace

DigestResult compute_sha256(const std::vector<uint8_t>& data) {
    Sha256 sha;
    sha.update(data.data(), data.size());
    return sha.finish();
}

DigestResult compute_sha256(const std::string& file_path) {
    std::ifstream in(file_path, std::ios::binary);
    if (!in) {
        DigestResult result;
        result.error = "failed to open file: " + file_path;
        return result;
    }

    Sha256 sha;
    std::array<char, 16384> chunk;
    while (in) {
        in.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        if (in.gcount() > 0) {
            sha.update(chunk.data(), static_cast<size_t>(in.gcount()));
        }
    }
    if (in.bad()) {
        DigestResult result;
        result.error = "failed to read file: " + file_path;
        return result;
    }
    return sha.finish();
}

DigestCheck verify_sha256(const std::vector<uint8_t>& data, const std::string& expected_hex) {
    DigestCheck check;
    auto digest = compute_sha256(data);
    if (!digest.ok) {
        check.error = digest.error;
        return check;
    }

    check.actual = digest.hex;
    std::string expected = lowercase(expected_hex);
    if (check.actual != expected) {
        check.error = "sha256 mismatch: expected " + expected + ", got " + check.actual;
        return check;
    }
    check.ok = true;
    return check;
}

// ============================================================================
// HTTPS (libcurl)
// ============================================================================

namespace {

class CurlEasy {
public:
    CurlEasy() : handle_(curl_easy_init()) {}
    ~CurlEasy() {
        if (handle_) curl_easy_cleanup(handle_);
    }

    CurlEasy(const CurlEasy&) = delete;
    CurlEasy& operator=(const CurlEasy&) = delete;

    CURL* get() { return handle_; }
    explicit operator bool() const { return handle_ != nullptr; }

private:
    CURL* handle_;
};

// Process-wide libcurl setup; workers may fetch concurrently
void ensure_curl_initialized() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

size_t append_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* body = static_cast<std::vector<uint8_t>*>(userdata);
    body->insert(body->end(), ptr, ptr + size * nmemb);
    return size * nmemb;
}

int check_cancel(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* cancel = static_cast<const CancellationToken*>(clientp);
    return cancel != nullptr && cancel->is_cancelled() ? 1 : 0;
}

bool is_transient(CURLcode code) {
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
        case CURLE_COULDNT_CONNECT:
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_PARTIAL_FILE:
            return true;
        default:
            return false;
    }
}

bool is_transient_status(long status) {
    return status == 408 || status == 429 || status >= 500;
}

} // namespace

FetchResult fetch_https(const std::string& url, std::chrono::milliseconds timeout,
                        const CancellationToken* cancel) {
    FetchResult result;
    ensure_curl_initialized();

    CurlEasy curl;
    if (!curl) {
        result.error = "curl_easy_init failed";
        return result;
    }

    char errbuf[CURL_ERROR_SIZE] = {0};
    long timeout_ms = static_cast<long>(timeout.count());

    CURL* h = curl.get();
    curl_easy_setopt(h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(h, CURLOPT_PROTOCOLS_STR, "https");
    curl_easy_setopt(h, CURLOPT_REDIR_PROTOCOLS_STR, "https");
    curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(h, CURLOPT_MAXREDIRS, 10L);
    curl_easy_setopt(h, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(h, CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT_MS, std::min(timeout_ms, 30000L));
    curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, timeout_ms);
    curl_easy_setopt(h, CURLOPT_USERAGENT, "strata");
    curl_easy_setopt(h, CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, append_body);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &result.data);
    curl_easy_setopt(h, CURLOPT_XFERINFOFUNCTION, check_cancel);
    curl_easy_setopt(h, CURLOPT_XFERINFODATA, cancel);
    curl_easy_setopt(h, CURLOPT_NOPROGRESS, 0L);

    CURLcode code = curl_easy_perform(h);
    if (code == CURLE_ABORTED_BY_CALLBACK) {
        result.data.clear();
        result.cancelled = true;
        result.transient = true;
        result.error = "download of " + url + " cancelled";
        return result;
    }
    if (code != CURLE_OK) {
        result.data.clear();
        result.transient = is_transient(code);
        result.error = "download of " + url + " failed: " +
                       (errbuf[0] != '\0' ? errbuf : curl_easy_strerror(code));
        return result;
    }

    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &result.http_status);
    if (result.http_status < 200 || result.http_status >= 300) {
        result.data.clear();
        result.transient = is_transient_status(result.http_status);
        result.error = "download of " + url + " failed: HTTP " +
                       std::to_string(result.http_status);
        return result;
    }

    result.ok = true;
    return result;
}

// ============================================================================
// Local Files
// ============================================================================

FetchResult fetch_file(const std::string& path) {
    FetchResult result;

    std::error_code ec;
    auto status = fs::status(path, ec);
    if (!fs::exists(status)) {
        result.error = "no such file: " + path;
        return result;
    }
    if (!fs::is_regular_file(status)) {
        result.error = "not a regular file: " + path;
        return result;
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        result.error = "cannot open " + path;
        return result;
    }
    result.data.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    if (in.bad()) {
        result.data.clear();
        result.error = "failed to read " + path;
        return result;
    }

    result.ok = true;
    return result;
}

} // namespace strata
