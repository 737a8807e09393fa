#pragma once

#include <string>
#include <unordered_map>

#include "mepg/graph/graph.h"

namespace mepg::electrical {

/**
 * @brief Relative failure impact of each node
 *
 * risk = (demand / total demand + non-load descendants / max non-load descendants) / 2,
 * then scaled so the largest score is 1. Zero denominators count as 1.
 */
class RiskScorer {
  public:
    std::unordered_map<std::string, Float> score(graph::Graph const& graph) const;

    /**
     * @brief Store the scores on the nodes
     */
    void apply(graph::Graph& graph) const;

    /**
     * @brief Distinct non-load nodes reachable downstream of a node
     */
    static size_t equipment_descendants(graph::Graph const& graph, std::string const& id);
};

}  // namespace mepg::electrical
