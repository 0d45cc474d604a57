#include <doctest/doctest.h>
#include <strata/snapshot.hpp>

#include "../test_support.hpp"

using namespace strata;
using strata::testing::TempDir;
using strata::testing::write_text;

namespace {

ResourceEffect set(const std::string& key, const std::string& value) {
    ResourceEffect effect;
    effect.key = key;
    effect.value = value;
    return effect;
}

ResourceEffect append(const std::string& key, const std::string& segment) {
    ResourceEffect effect;
    effect.op = EffectOp::AppendSegment;
    effect.key = key;
    effect.value = segment;
    effect.separator = ":";
    return effect;
}

} // namespace

TEST_CASE("each applied step advances the revision by one") {
    Snapshot snap;
    CHECK(snap.revision() == 0);

    snap.apply_step_effects("numpy", {set("pkg:numpy", "1.26.4")});
    CHECK(snap.revision() == 1);
    CHECK(snap.get("pkg:numpy") == std::optional<std::string>("1.26.4"));
    CHECK(snap.was_applied("numpy"));
    CHECK(snap.provenance().at("numpy") == 1);

    snap.apply_step_effects("path", {append("envvar:PATH", "/a"), append("envvar:PATH", "/b")});
    CHECK(snap.revision() == 2);
    CHECK(snap.get("envvar:PATH") == std::optional<std::string>("/a:/b"));
    CHECK_FALSE(snap.updated_at().empty());
}

TEST_CASE("seed and forget leave the revision alone") {
    Snapshot snap;
    snap.seed("pkg:a", "1");
    CHECK(snap.revision() == 0);
    CHECK(snap.contains("pkg:a"));
    CHECK_FALSE(snap.was_applied("a"));

    snap.forget("pkg:a");
    CHECK_FALSE(snap.contains("pkg:a"));
    CHECK(snap.revision() == 0);
}

TEST_CASE("satisfied steps gain provenance without a new revision") {
    Snapshot snap;
    snap.apply_step_effects("numpy", {set("pkg:numpy", "1.26")});
    snap.mark_satisfied("numpy-again");

    CHECK(snap.revision() == 1);
    CHECK(snap.was_applied("numpy-again"));
    CHECK(snap.provenance().at("numpy-again") == 1);

    // An earlier record is kept
    snap.apply_step_effects("other", {set("pkg:other", "1")});
    snap.mark_satisfied("numpy");
    CHECK(snap.provenance().at("numpy") == 1);
}

TEST_CASE("failures last until the step succeeds") {
    Snapshot snap;
    snap.record_failure("weather", "checksum mismatch");
    CHECK(snap.last_failure("weather") == std::optional<std::string>("checksum mismatch"));
    CHECK(snap.revision() == 0);

    snap.apply_step_effects("weather", {set("artifact:/w", "abc")});
    CHECK_FALSE(snap.last_failure("weather").has_value());

    snap.record_failure("numpy", "exit 1");
    snap.mark_satisfied("numpy");
    CHECK(snap.failures().empty());
}

TEST_CASE("snapshot survives save and load") {
    TempDir dir;
    std::string path = dir.file("state/snapshot.json");

    Snapshot snap;
    snap.apply_step_effects("python", {set("env:sim:python-version", "3.10")});
    snap.apply_step_effects("plugins", {append("envvar:PYTHONPATH", "/opt/teaser")});
    snap.mark_satisfied("python-again");
    snap.record_failure("weather", "download failed: HTTP 503");

    auto saved = save_snapshot(path, snap);
    REQUIRE(saved.ok);

    auto loaded = load_snapshot(path);
    REQUIRE(loaded.ok);
    CHECK(loaded.snapshot == snap);
    CHECK(loaded.snapshot.last_failure("weather") ==
          std::optional<std::string>("download failed: HTTP 503"));
    CHECK(loaded.snapshot.was_applied("python-again"));
    CHECK(loaded.snapshot.updated_at() == snap.updated_at());
    CHECK(serialize_snapshot(loaded.snapshot) == serialize_snapshot(snap));
}

TEST_CASE("legacy snapshot schema is rejected with a migration hint") {
    auto result = parse_snapshot(R"({"$schema": "strata.snapshot.v1", "values": {}})", "old.json");
    CHECK_FALSE(result.ok);
    CHECK(result.error.kind == ErrorKind::SnapshotSchemaError);
    CHECK(result.error.message.find("no longer supported") != std::string::npos);
    CHECK(result.error.message.find("old.json") == 0);
}

TEST_CASE("malformed snapshots are rejected") {
    SUBCASE("unknown schema") {
        auto result = parse_snapshot(R"({"$schema": "strata.snapshot.v9", "revision": 0})");
        CHECK(result.error.kind == ErrorKind::SnapshotSchemaError);
        CHECK(result.error.message.find("unknown snapshot schema") != std::string::npos);
    }
    SUBCASE("missing revision") {
        auto result = parse_snapshot(R"({"$schema": "strata.snapshot.v2"})");
        CHECK_FALSE(result.ok);
    }
    SUBCASE("non-string resource") {
        auto result = parse_snapshot(
            R"({"$schema": "strata.snapshot.v2", "revision": 1, "resources": {"pkg:a": 3}})");
        CHECK_FALSE(result.ok);
    }
    SUBCASE("provenance ahead of revision") {
        auto result = parse_snapshot(
            R"({"$schema": "strata.snapshot.v2", "revision": 1, "provenance": {"a": 2}})");
        CHECK_FALSE(result.ok);
    }
    SUBCASE("not JSON") {
        auto result = parse_snapshot("][");
        CHECK(result.error.kind == ErrorKind::SnapshotSchemaError);
    }
}

TEST_CASE("load_snapshot reports unreadable files") {
    TempDir dir;
    auto result = load_snapshot(dir.file("missing.json"));
    CHECK_FALSE(result.ok);

    write_text(dir.file("empty.json"), "");
    CHECK_FALSE(load_snapshot(dir.file("empty.json")).ok);
}
