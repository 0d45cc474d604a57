#include <doctest/doctest.h>
#include <strata/materializer.hpp>

#include "../test_support.hpp"

#include <cctype>
#include <string>
#include <vector>

using namespace strata;
using strata::testing::TempDir;
using strata::testing::write_text;

namespace {

const char* ABC_SHA256 = "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";
const char* EMPTY_SHA256 = "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";

std::vector<uint8_t> bytes(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

} // namespace

// ============================================================================
// Reference Parsing
// ============================================================================

TEST_CASE("parse_artifact_reference handles file: references") {
    auto ref = parse_artifact_reference("file:/srv/weather/DEU_Essen.epw");
    CHECK(ref.scheme == ArtifactScheme::File);
    CHECK(ref.location == "/srv/weather/DEU_Essen.epw");
    CHECK(ref.error.empty());

    auto relative = parse_artifact_reference("file:./data/w.epw");
    CHECK(relative.scheme == ArtifactScheme::File);
    CHECK(relative.location == "./data/w.epw");

    auto url_form = parse_artifact_reference("file:///srv/weather/DEU_Essen.epw");
    CHECK(url_form.scheme == ArtifactScheme::File);
    CHECK(url_form.location == "/srv/weather/DEU_Essen.epw");

    auto empty = parse_artifact_reference("file:");
    CHECK(empty.scheme == ArtifactScheme::Invalid);
}

TEST_CASE("file: references may carry a digest fragment") {
    auto ref = parse_artifact_reference(std::string("file:/srv/model.bin#sha256=") + ABC_SHA256);
    CHECK(ref.scheme == ArtifactScheme::File);
    CHECK(ref.location == "/srv/model.bin");
    CHECK(ref.sha256 == ABC_SHA256);
}

TEST_CASE("parse_artifact_reference handles https references") {
    SUBCASE("without digest") {
        auto ref = parse_artifact_reference("https://example.com/model.zip");
        CHECK(ref.scheme == ArtifactScheme::Https);
        CHECK(ref.location == "https://example.com/model.zip");
        CHECK(ref.sha256.empty());
    }

    SUBCASE("digest fragment is split off and lowercased") {
        std::string upper = "BA7816BF8F01CFEA414140DE5DAE2223B00361A396177A9CB410FF61F20015AD";
        auto ref = parse_artifact_reference("https://example.com/model.zip#sha256=" + upper);
        CHECK(ref.scheme == ArtifactScheme::Https);
        CHECK(ref.location == "https://example.com/model.zip");
        CHECK(ref.sha256 == ABC_SHA256);
    }

    SUBCASE("other fragments are rejected") {
        auto ref = parse_artifact_reference("https://example.com/model.zip#md5=abc");
        CHECK(ref.scheme == ArtifactScheme::Invalid);
    }

    SUBCASE("short digest is rejected") {
        auto ref = parse_artifact_reference("https://example.com/model.zip#sha256=abcd");
        CHECK(ref.scheme == ArtifactScheme::Invalid);
        CHECK(ref.error.find("64") != std::string::npos);
    }
}

TEST_CASE("parse_artifact_reference rejects unsupported schemes") {
    auto http = parse_artifact_reference("http://example.com/model.zip");
    CHECK(http.scheme == ArtifactScheme::Invalid);
    CHECK(http.error.find("HTTPS") != std::string::npos);

    CHECK(parse_artifact_reference("ftp://example.com/x").scheme == ArtifactScheme::Invalid);
    CHECK(parse_artifact_reference("").scheme == ArtifactScheme::Invalid);
}

TEST_CASE("is_sha256_hex") {
    CHECK(is_sha256_hex(ABC_SHA256));
    CHECK(is_sha256_hex(std::string(64, 'F')));
    CHECK_FALSE(is_sha256_hex(std::string(63, 'a')));
    CHECK_FALSE(is_sha256_hex(std::string(64, 'g')));
}

// ============================================================================
// SHA-256
// ============================================================================

TEST_CASE("compute_sha256 of known inputs") {
    auto abc = compute_sha256(bytes("abc"));
    REQUIRE(abc.ok);
    CHECK(abc.hex == ABC_SHA256);

    auto empty = compute_sha256(std::vector<uint8_t>{});
    REQUIRE(empty.ok);
    CHECK(empty.hex == EMPTY_SHA256);
}

TEST_CASE("compute_sha256 of a file") {
    TempDir dir;
    write_text(dir.file("abc.txt"), "abc");

    auto result = compute_sha256(dir.file("abc.txt"));
    REQUIRE(result.ok);
    CHECK(result.hex == ABC_SHA256);

    CHECK_FALSE(compute_sha256(dir.file("missing.txt")).ok);
}

TEST_CASE("verify_sha256") {
    auto match = verify_sha256(bytes("abc"), ABC_SHA256);
    CHECK(match.ok);
    CHECK(match.actual == ABC_SHA256);

    std::string upper(ABC_SHA256);
    for (auto& c : upper) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    CHECK(verify_sha256(bytes("abc"), upper).ok);

    auto mismatch = verify_sha256(bytes("abd"), ABC_SHA256);
    CHECK_FALSE(mismatch.ok);
    CHECK(mismatch.error.find("mismatch") != std::string::npos);
}

// ============================================================================
// Local Fetch
// ============================================================================

TEST_CASE("fetch_file reads bytes and fails for missing files") {
    TempDir dir;
    write_text(dir.file("data.bin"), "payload");

    auto ok = fetch_file(dir.file("data.bin"));
    REQUIRE(ok.ok);
    CHECK(ok.data == bytes("payload"));

    auto missing = fetch_file(dir.file("nope.bin"));
    CHECK_FALSE(missing.ok);
    CHECK_FALSE(missing.transient);

    auto directory = fetch_file(dir.path());
    CHECK_FALSE(directory.ok);
    CHECK(directory.error.find("not a regular file") == 0);
}

TEST_CASE("fetch_https stops when already cancelled") {
    CancellationToken cancel;
    cancel.cancel();
    auto result = fetch_https("https://127.0.0.1:9/artifact.bin", std::chrono::milliseconds(2000),
                              &cancel);
    CHECK_FALSE(result.ok);
    CHECK(result.transient);
}
