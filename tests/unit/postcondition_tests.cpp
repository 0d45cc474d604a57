#include <doctest/doctest.h>
#include <strata/postcondition.hpp>
#include <strata/snapshot.hpp>

#include "../test_support.hpp"

using namespace strata;
using strata::testing::make_step;
using strata::testing::package;
using strata::testing::path_append;

// ============================================================================
// Resource Keys
// ============================================================================

TEST_CASE("resource keys per kind") {
    CHECK(resource_key(package("p", "numpy", "1")) == "pkg:numpy");
    CHECK(resource_key(make_step("e", ActionKind::CreateInterpreterEnv,
                                 {{"name", "sim"}, {"python-version", "3.10"}})) ==
          "env:sim:python-version");
    CHECK(resource_key(path_append("v", "PYTHONPATH", "/a")) == "envvar:PYTHONPATH");
    CHECK(resource_key(make_step("f", ActionKind::FetchArtifact,
                                 {{"url", "file:/x"}, {"dest", "/opt/x"}})) == "artifact:/opt/x");
    CHECK(resource_key(make_step("m", ActionKind::SetPermission,
                                 {{"path", "/opt/x"}, {"mode", "755"}})) == "perm:/opt/x");
}

// ============================================================================
// Predicates
// ============================================================================

TEST_CASE("install-package compares the pinned version") {
    Snapshot snap;
    auto step = package("numpy", "numpy", "1.26.4");

    CHECK_FALSE(evaluate_postcondition(step, snap).holds);

    snap.seed("pkg:numpy", "1.25.0");
    auto stale = evaluate_postcondition(step, snap);
    CHECK_FALSE(stale.holds);
    CHECK(stale.detail.find("1.25.0") != std::string::npos);

    snap.seed("pkg:numpy", "1.26.4");
    CHECK(evaluate_postcondition(step, snap).holds);
}

TEST_CASE("install-package without version only needs presence") {
    Snapshot snap;
    auto step = make_step("ifc", ActionKind::InstallPackage, {{"name", "ifcopenshell"}});

    CHECK_FALSE(evaluate_postcondition(step, snap).holds);
    snap.seed("pkg:ifcopenshell", "0.7.0");
    CHECK(evaluate_postcondition(step, snap).holds);
    CHECK(describe_postcondition(step) == "pkg:ifcopenshell present");
}

TEST_CASE("fetch-artifact uses the declared digest") {
    std::string digest = "BA7816BF8F01CFEA414140DE5DAE2223B00361A396177A9CB410FF61F20015AD";
    auto step = make_step("w", ActionKind::FetchArtifact,
                          {{"url", "https://example.com/w.epw"}, {"dest", "/d/w.epw"},
                           {"sha256", digest}});

    CHECK(expected_artifact_digest(step) ==
          "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

    Snapshot snap;
    snap.seed("artifact:/d/w.epw", expected_artifact_digest(step));
    CHECK(evaluate_postcondition(step, snap).holds);

    snap.seed("artifact:/d/w.epw", std::string(64, '0'));
    CHECK_FALSE(evaluate_postcondition(step, snap).holds);
}

TEST_CASE("fetch-artifact reads the digest from the url fragment") {
    std::string digest(64, 'a');
    auto step = make_step("w", ActionKind::FetchArtifact,
                          {{"url", "https://example.com/w.epw#sha256=" + digest},
                           {"dest", "/d/w.epw"}});
    CHECK(expected_artifact_digest(step) == digest);
}

TEST_CASE("set-permission compares normalized modes") {
    auto step = make_step("m", ActionKind::SetPermission, {{"path", "/opt/run"}, {"mode", "755"}});

    Snapshot snap;
    snap.seed("perm:/opt/run", "0755");
    CHECK(evaluate_postcondition(step, snap).holds);

    snap.seed("perm:/opt/run", "0644");
    CHECK_FALSE(evaluate_postcondition(step, snap).holds);
}

TEST_CASE("normalize_mode") {
    CHECK(normalize_mode("755") == std::optional<std::string>("0755"));
    CHECK(normalize_mode("0755") == std::optional<std::string>("0755"));
    CHECK(normalize_mode("0o644") == std::optional<std::string>("0644"));
    CHECK(normalize_mode("7") == std::optional<std::string>("0007"));
    CHECK_FALSE(normalize_mode("").has_value());
    CHECK_FALSE(normalize_mode("0o").has_value());
    CHECK_FALSE(normalize_mode("888").has_value());
    CHECK_FALSE(normalize_mode("10755").has_value());
    CHECK_FALSE(normalize_mode("rwx").has_value());
}

TEST_CASE("evaluation is pure") {
    Snapshot snap;
    snap.seed("pkg:numpy", "1.0");
    Snapshot before = snap;

    auto step = package("numpy", "numpy", "2.0");
    auto first = evaluate_postcondition(step, snap);
    auto second = evaluate_postcondition(step, snap);

    CHECK(first.holds == second.holds);
    CHECK(first.detail == second.detail);
    CHECK(snap == before);
}

// ============================================================================
// Path Lists
// ============================================================================

TEST_CASE("appends compose in order without duplication") {
    std::string value;
    value = append_path_segment(value, "segA", "", ":");
    value = append_path_segment(value, "segB", "", ":");
    CHECK(value == "segA:segB");

    // Re-applying either append is a no-op
    CHECK(append_path_segment(value, "segA", "", ":") == "segA:segB");
    CHECK(append_path_segment(value, "segB", "", ":") == "segA:segB");
}

TEST_CASE("append keeps existing segments and drops empty ones") {
    CHECK(append_path_segment("/usr/lib::/opt/lib", "/x", "", ":") == "/usr/lib:/opt/lib:/x");
    CHECK(append_path_segment("", "/x", "", ";") == "/x");
}

TEST_CASE("append after an anchor") {
    SUBCASE("segment already after anchor is unchanged") {
        CHECK(append_path_segment("a:b:c", "c", "b", ":") == "a:b:c");
    }
    SUBCASE("segment before anchor moves to the end") {
        CHECK(append_path_segment("c:a:b", "c", "b", ":") == "a:b:c");
    }
    SUBCASE("new segment is appended") {
        CHECK(append_path_segment("a:b", "c", "a", ":") == "a:b:c");
    }
}

TEST_CASE("path predicate checks presence and anchor order") {
    Snapshot snap;
    auto plain = path_append("a", "PYTHONPATH", "segA");
    auto anchored = make_step("b", ActionKind::MutatePathVariable,
                              {{"name", "PYTHONPATH"}, {"segment", "segB"}, {"after", "segA"},
                               {"separator", ":"}});

    CHECK_FALSE(evaluate_postcondition(plain, snap).holds);

    snap.seed("envvar:PYTHONPATH", "segB:segA");
    CHECK(evaluate_postcondition(plain, snap).holds);
    CHECK_FALSE(evaluate_postcondition(anchored, snap).holds);

    snap.seed("envvar:PYTHONPATH", "segA:segB");
    CHECK(evaluate_postcondition(anchored, snap).holds);

    snap.seed("envvar:PYTHONPATH", "segB");
    auto missing_anchor = evaluate_postcondition(anchored, snap);
    CHECK_FALSE(missing_anchor.holds);
    CHECK(missing_anchor.detail.find("anchor") != std::string::npos);
}

TEST_CASE("separator defaults to the platform path-list separator") {
    auto step = make_step("v", ActionKind::MutatePathVariable, {{"name", "PATH"}, {"segment", "/x"}});
    CHECK(step_separator(step) == std::string(1, path_list_separator()));
}

TEST_CASE("declared postcondition text wins in descriptions") {
    auto step = package("numpy", "numpy", "1.0");
    CHECK(describe_postcondition(step) == "pkg:numpy == 1.0");
    step.postcondition = "numpy importable";
    CHECK(describe_postcondition(step) == "numpy importable");
}

TEST_CASE("is_environment_variable_name") {
    CHECK(is_environment_variable_name("PATH"));
    CHECK(is_environment_variable_name("_private_1"));
    CHECK_FALSE(is_environment_variable_name(""));
    CHECK_FALSE(is_environment_variable_name("9LIVES"));
    CHECK_FALSE(is_environment_variable_name("A-B"));
    CHECK_FALSE(is_environment_variable_name("X;touch /tmp/p"));
    CHECK_FALSE(is_environment_variable_name("X=1"));
}
