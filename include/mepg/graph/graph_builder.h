#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "mepg/core/random_source.h"
#include "mepg/core/types.h"
#include "mepg/graph/graph.h"

namespace mepg::graph {

struct BuilderConfig {
    int construction_year = 2024;  // Installation year of every node
    Float power_factor = 0.9;      // Assumed for end loads
};

/**
 * @brief Materialized graph plus the decision id to node id map
 */
struct BuildResult {
    Graph graph;
    std::unordered_map<int, std::string> node_ids;
};

/**
 * @brief Turns equipment decisions into provisional nodes and hierarchy edges
 *
 * Edges are added in a fixed order:
 * 1. main transformer -> main switchboard
 * 2. main switchboard -> every secondary transformer
 * 3. secondary transformer -> every panelboard on its floor
 * 4. main switchboard -> panelboards on above-grade floors without a secondary transformer
 * 5. load -> nearest panelboard
 */
class GraphBuilder {
  public:
    explicit GraphBuilder(BuilderConfig config = {}) : config_(config) {}

    BuildResult build(std::vector<NodeDecision> const& decisions, RandomSource& rng) const;

    /**
     * @brief Add a power edge with its cable distance and classification label
     * @return false if the edge already exists
     */
    static bool connect(Graph& graph, std::string const& source, std::string const& target,
                        std::string const& label);

  private:
    Node make_node(NodeDecision const& decision, std::string id, RandomSource& rng) const;

    BuilderConfig config_;
};

/**
 * @brief Format a node id such as "panelboard_003"
 */
std::string make_node_id(NodeType type, int number);

}  // namespace mepg::graph
