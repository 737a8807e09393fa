#pragma once

#include <array>
#include <string>
#include <vector>

#include "mepg/core/types.h"
#include "mepg/graph/graph.h"

namespace mepg::electrical {

/**
 * @brief The three permissible voltage tiers of one graph
 */
struct StandardVoltages {
    static constexpr std::array<Float, 2> HIGH_TIER_OPTIONS = {13500.0, 4160.0};

    Float high = 13500.0;
    Float medium = 480.0;
    Float low = 208.0;

    /**
     * @brief Tiers ordered from highest to lowest
     */
    std::array<Float, 3> tiers() const noexcept { return {high, medium, low}; }

    /**
     * @brief Highest tier at least 20 % below the given voltage, else the low tier
     */
    Float step_down(Float upstream) const noexcept;

    /**
     * @brief Tier closest to the given voltage; ties go to the higher tier
     */
    Float nearest(Float voltage) const noexcept;
};

struct PropagationConfig {
    Float frequency = 60.0;              // Hz
    Float power_factor = 0.9;
    Float cable_resistance = 0.0005;     // Ohm per metre of conductor
    Float single_phase_limit = 240.0;    // Edges at or below this voltage are single phase
};

struct PropagationSummary {
    std::vector<std::string> sources;
    size_t energized_nodes = 0;
    size_t energized_edges = 0;
    size_t unreached_nodes = 0;
};

/**
 * @brief Pushes voltage, phase and current from the source nodes downstream
 *
 * Traversal is a breadth-first worklist with a visited set, so an accidental
 * cycle cannot loop. A node takes its voltages from the first predecessor that
 * reaches it. After voltages are assigned, downstream demand is rolled up in
 * reverse topological order, a node with several feeds splitting its demand
 * evenly between them. Currents are then derived and every reached node and
 * edge is energized. Running it again recomputes everything from the sources.
 */
class VoltagePropagator {
  public:
    explicit VoltagePropagator(StandardVoltages voltages, PropagationConfig config = {})
        : voltages_(voltages), config_(config) {}

    PropagationSummary propagate(graph::Graph& graph) const;

    /**
     * @brief Resolve one edge from its source's downstream voltage and its target's demand
     */
    void energize_edge(graph::Graph const& graph, graph::Edge& edge) const;

    /**
     * @brief Recompute a node's currents and standard ratings from its voltages and demand
     */
    void update_currents(graph::Node& node) const;

    /**
     * @brief Reassign voltages below a node whose downstream voltage changed
     *
     * Every node reachable from `from` takes its voltages from the first
     * refreshed predecessor; currents, ratings and the outgoing edges of the
     * refreshed nodes are recomputed. Demand is left as is.
     * @return Number of nodes below `from` that were refreshed
     */
    size_t refresh_downstream(graph::Graph& graph, std::string const& from) const;

    StandardVoltages const& voltages() const noexcept { return voltages_; }
    PropagationConfig const& config() const noexcept { return config_; }

  private:
    void seed_source(graph::Node& node) const;
    void assign_from(graph::Node const& source, graph::Node& target) const;
    int edge_phase_count(graph::Node const& target, Float voltage) const noexcept;

    StandardVoltages voltages_;
    PropagationConfig config_;
};

}  // namespace mepg::electrical
