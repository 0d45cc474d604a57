#include <doctest/doctest.h>
#include <strata/graph.hpp>

#include "../test_support.hpp"

#include <algorithm>

using namespace strata;
using strata::testing::package;

TEST_CASE("plan respects prerequisites") {
    std::vector<Step> steps = {
        package("plugin", "teaser", "1.0", {"numpy", "python"}),
        package("numpy", "numpy", "1.26", {"python"}),
        package("python", "python", "3.10"),
    };

    auto result = build_plan(steps);
    REQUIRE(result.ok);
    auto order = result.plan.order();
    REQUIRE(order.size() == 3);
    CHECK(order == std::vector<std::string>{"python", "numpy", "plugin"});

    // Prerequisite positions point at earlier entries
    for (size_t pos = 0; pos < result.plan.entries.size(); ++pos) {
        for (size_t pre : result.plan.entries[pos].prerequisites) {
            CHECK(pre < pos);
        }
    }
}

TEST_CASE("independent steps keep declaration order") {
    std::vector<Step> steps = {
        package("c", "c", "1"),
        package("a", "a", "1"),
        package("b", "b", "1", {"c"}),
        package("d", "d", "1"),
    };

    auto result = build_plan(steps);
    REQUIRE(result.ok);
    CHECK(result.plan.order() == std::vector<std::string>{"c", "a", "b", "d"});
    CHECK(result.plan.entries[2].declaration_index == 2);
}

TEST_CASE("ties resolve to the lowest declaration index once ready") {
    // z and x become ready together; z was declared first
    std::vector<Step> steps = {
        package("y", "y", "1"),
        package("z", "z", "1", {"y"}),
        package("x", "x", "1", {"y"}),
    };

    auto result = build_plan(steps);
    REQUIRE(result.ok);
    CHECK(result.plan.order() == std::vector<std::string>{"y", "z", "x"});
}

TEST_CASE("two-step cycle is rejected with the full path") {
    std::vector<Step> steps = {
        package("A", "a", "1", {"B"}),
        package("B", "b", "1", {"A"}),
    };

    auto result = DependencyGraph::build(steps);
    CHECK_FALSE(result.ok);
    CHECK(result.error.kind == ErrorKind::CycleError);
    CHECK(result.error.step_ids == std::vector<std::string>{"A", "B", "A"});
    CHECK(result.error.message.find("A -> B -> A") != std::string::npos);
}

TEST_CASE("self prerequisite is a cycle") {
    std::vector<Step> steps = {package("solo", "s", "1", {"solo"})};

    auto result = build_plan(steps);
    CHECK_FALSE(result.ok);
    CHECK(result.error.kind == ErrorKind::CycleError);
    CHECK(result.error.step_ids == std::vector<std::string>{"solo", "solo"});
}

TEST_CASE("longer cycle reports only the cycle members") {
    std::vector<Step> steps = {
        package("root", "r", "1"),
        package("p", "p", "1", {"root", "r"}),
        package("q", "q", "1", {"p"}),
        package("r", "r2", "1", {"q"}),
    };

    auto result = build_plan(steps);
    REQUIRE(result.error.kind == ErrorKind::CycleError);
    auto ids = result.error.step_ids;
    REQUIRE(ids.size() == 4);
    CHECK(ids.front() == ids.back());
    CHECK(std::find(ids.begin(), ids.end(), "root") == ids.end());
}

TEST_CASE("unknown prerequisite names both steps") {
    std::vector<Step> steps = {package("a", "a", "1", {"ghost"})};

    auto result = build_plan(steps);
    CHECK(result.error.kind == ErrorKind::UnknownPrerequisiteError);
    CHECK(result.error.step_ids == std::vector<std::string>{"a", "ghost"});
    CHECK(result.error.relation == "a requires ghost");
}

TEST_CASE("duplicate ids are rejected by the graph") {
    std::vector<Step> steps = {package("a", "a", "1"), package("a", "b", "1")};

    auto result = DependencyGraph::build(steps);
    CHECK(result.error.kind == ErrorKind::DuplicateStepError);
}

TEST_CASE("repeated prerequisites collapse to one edge") {
    std::vector<Step> steps = {
        package("a", "a", "1"),
        package("b", "b", "1", {"a", "a"}),
    };

    auto result = DependencyGraph::build(steps);
    REQUIRE(result.ok);
    CHECK(result.graph.nodes()[1].prerequisites.size() == 1);
    CHECK(result.graph.nodes()[0].dependents.size() == 1);
}

TEST_CASE("graph nodes link prerequisites and dependents") {
    std::vector<Step> steps = {
        package("a", "a", "1"),
        package("b", "b", "1", {"a"}),
        package("c", "c", "1", {"b"}),
        package("d", "d", "1"),
    };

    auto result = DependencyGraph::build(steps);
    REQUIRE(result.ok);
    const auto& nodes = result.graph.nodes();
    CHECK(nodes[2].prerequisites == std::vector<size_t>{1});
    CHECK(nodes[0].dependents == std::vector<size_t>{1});
    CHECK(nodes[3].prerequisites.empty());
    CHECK(nodes[3].dependents.empty());
}

TEST_CASE("empty step set yields an empty plan") {
    auto result = build_plan({});
    REQUIRE(result.ok);
    CHECK(result.plan.empty());
    CHECK(result.plan.order().empty());
}
