#include "mepg/electrical/risk_scorer.h"

#include <algorithm>
#include <unordered_set>
#include <vector>

#include "mepg/logging/logger.h"

namespace mepg::electrical {

size_t RiskScorer::equipment_descendants(graph::Graph const& graph, std::string const& id) {
    std::unordered_set<std::string> seen{id};
    std::vector<std::string> stack{id};
    size_t count = 0;

    while (!stack.empty()) {
        std::string const current = stack.back();
        stack.pop_back();
        for (auto const& next : graph.successors(current)) {
            if (!seen.insert(next).second) continue;
            if (graph.node(next).type != NodeType::LOAD) ++count;
            stack.push_back(next);
        }
    }
    return count;
}

std::unordered_map<std::string, Float> RiskScorer::score(graph::Graph const& graph) const {
    std::unordered_map<std::string, Float> scores;
    if (graph.node_count() == 0) return scores;

    Float total_demand = 0.0;
    std::unordered_map<std::string, size_t> descendants;
    size_t max_descendants = 0;
    for (auto const& node : graph.nodes()) {
        total_demand += node.demand;
        size_t const n = equipment_descendants(graph, node.id);
        descendants.emplace(node.id, n);
        max_descendants = std::max(max_descendants, n);
    }
    if (total_demand <= 0.0) total_demand = 1.0;
    Float const descendant_scale = max_descendants == 0 ? 1.0 : static_cast<Float>(max_descendants);

    Float max_score = 0.0;
    for (auto const& node : graph.nodes()) {
        Float const risk = (node.demand / total_demand +
                            static_cast<Float>(descendants.at(node.id)) / descendant_scale) /
                           2.0;
        scores[node.id] = risk;
        max_score = std::max(max_score, risk);
    }

    if (max_score <= 0.0) max_score = 1.0;
    for (auto& [id, risk] : scores) {
        risk /= max_score;
    }
    return scores;
}

void RiskScorer::apply(graph::Graph& graph) const {
    auto const scores = score(graph);
    for (auto& node : graph.nodes()) {
        node.risk_score = scores.at(node.id);
    }

    auto& logger = logging::global_logger;
    LOG_DEBUG(logger, "Scored risk for", scores.size(), "nodes");
}

}  // namespace mepg::electrical
