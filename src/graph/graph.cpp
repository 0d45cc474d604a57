#include "strata/graph.hpp"

#include <algorithm>
#include <functional>
#include <queue>
#include <utility>

namespace strata {

std::vector<std::string> ExecutionPlan::order() const {
    std::vector<std::string> ids;
    ids.reserve(entries.size());
    for (const auto& entry : entries) {
        ids.push_back(entry.step.id);
    }
    return ids;
}

namespace {

GraphResult graph_error(ErrorKind kind, std::string message,
                        std::vector<std::string> step_ids, std::string relation) {
    GraphResult result;
    result.error.kind = kind;
    result.error.message = std::move(message);
    result.error.step_ids = std::move(step_ids);
    result.error.relation = std::move(relation);
    return result;
}

std::string join_arrow(const std::vector<std::string>& ids) {
    std::string out;
    for (size_t i = 0; i < ids.size(); ++i) {
        if (i > 0) out += " -> ";
        out += ids[i];
    }
    return out;
}

} // namespace

GraphResult DependencyGraph::build(const std::vector<Step>& steps) {
    DependencyGraph graph;
    graph.steps_ = steps;
    graph.nodes_.resize(steps.size());

    for (size_t i = 0; i < steps.size(); ++i) {
        if (!graph.index_.emplace(steps[i].id, i).second) {
            return graph_error(ErrorKind::DuplicateStepError,
                               "duplicate step id '" + steps[i].id + "'",
                               {steps[i].id}, "id must be unique");
        }
        graph.nodes_[i].id = steps[i].id;
    }

    // Resolve prerequisites
    for (size_t i = 0; i < steps.size(); ++i) {
        for (const auto& pre_id : steps[i].prerequisites) {
            auto it = graph.index_.find(pre_id);
            if (it == graph.index_.end()) {
                return graph_error(ErrorKind::UnknownPrerequisiteError,
                                   "step '" + steps[i].id + "' requires unknown step '" + pre_id + "'",
                                   {steps[i].id, pre_id},
                                   steps[i].id + " requires " + pre_id);
            }
            auto& pres = graph.nodes_[i].prerequisites;
            if (std::find(pres.begin(), pres.end(), it->second) == pres.end()) {
                pres.push_back(it->second);
                graph.nodes_[it->second].dependents.push_back(i);
            }
        }
    }

    // Cycle detection: DFS along "requires" edges with a recursion stack
    enum class Mark { Unvisited, OnStack, Done };
    std::vector<Mark> mark(steps.size(), Mark::Unvisited);
    std::vector<size_t> path;

    for (size_t start = 0; start < steps.size(); ++start) {
        if (mark[start] != Mark::Unvisited) continue;

        std::vector<std::pair<size_t, size_t>> stack;  // node, next edge
        stack.emplace_back(start, 0);
        mark[start] = Mark::OnStack;
        path.push_back(start);

        while (!stack.empty()) {
            size_t node = stack.back().first;
            size_t edge = stack.back().second;
            const auto& pres = graph.nodes_[node].prerequisites;

            if (edge == pres.size()) {
                mark[node] = Mark::Done;
                path.pop_back();
                stack.pop_back();
                continue;
            }

            stack.back().second++;
            size_t next = pres[edge];

            if (mark[next] == Mark::OnStack) {
                auto from = std::find(path.begin(), path.end(), next);
                std::vector<std::string> cycle;
                for (auto it = from; it != path.end(); ++it) {
                    cycle.push_back(graph.nodes_[*it].id);
                }
                cycle.push_back(graph.nodes_[next].id);
                return graph_error(ErrorKind::CycleError,
                                   "prerequisite cycle " + join_arrow(cycle),
                                   cycle, "requires: " + join_arrow(cycle));
            }

            if (mark[next] == Mark::Unvisited) {
                mark[next] = Mark::OnStack;
                path.push_back(next);
                stack.emplace_back(next, 0);
            }
        }
    }

    // Kahn's algorithm, lowest declaration index first
    std::vector<size_t> remaining(steps.size());
    std::priority_queue<size_t, std::vector<size_t>, std::greater<size_t>> ready;
    for (size_t i = 0; i < steps.size(); ++i) {
        remaining[i] = graph.nodes_[i].prerequisites.size();
        if (remaining[i] == 0) ready.push(i);
    }

    while (!ready.empty()) {
        size_t i = ready.top();
        ready.pop();
        graph.topo_order_.push_back(i);
        for (size_t dep : graph.nodes_[i].dependents) {
            if (--remaining[dep] == 0) ready.push(dep);
        }
    }

    GraphResult result;
    result.ok = true;
    result.graph = std::move(graph);
    return result;
}

ExecutionPlan DependencyGraph::plan() const {
    ExecutionPlan plan;
    std::vector<size_t> position(nodes_.size(), 0);
    for (size_t pos = 0; pos < topo_order_.size(); ++pos) {
        position[topo_order_[pos]] = pos;
    }

    for (size_t idx : topo_order_) {
        PlannedStep entry;
        entry.step = steps_[idx];
        entry.declaration_index = idx;
        for (size_t pre : nodes_[idx].prerequisites) {
            entry.prerequisites.push_back(position[pre]);
        }
        plan.entries.push_back(std::move(entry));
    }
    return plan;
}

PlanResult build_plan(const std::vector<Step>& steps) {
    PlanResult result;
    auto graph = DependencyGraph::build(steps);
    if (!graph.ok) {
        result.error = graph.error;
        return result;
    }
    result.plan = graph.graph.plan();
    result.ok = true;
    return result;
}

} // namespace strata
