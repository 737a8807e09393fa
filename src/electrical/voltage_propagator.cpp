#include "mepg/electrical/voltage_propagator.h"

#include <cmath>
#include <deque>
#include <type_traits>
#include <unordered_map>
#include <unordered_set>
#include <variant>

#include "mepg/electrical/equipment_sizing.h"
#include "mepg/logging/logger.h"

namespace mepg::electrical {

using graph::Graph;
using graph::Node;
using graph::NodeState;

Float StandardVoltages::step_down(Float upstream) const noexcept {
    Float const limit = upstream * 0.8;
    for (Float tier : tiers()) {
        if (tier <= limit) return tier;
    }
    return low;
}

Float StandardVoltages::nearest(Float voltage) const noexcept {
    Float best = high;
    for (Float tier : tiers()) {
        if (std::abs(tier - voltage) < std::abs(best - voltage)) best = tier;
    }
    return best;
}

int VoltagePropagator::edge_phase_count(Node const& target, Float voltage) const noexcept {
    if (target.type == NodeType::LOAD) return 1;
    return voltage > config_.single_phase_limit ? 3 : 1;
}

void VoltagePropagator::seed_source(Node& node) const {
    std::visit(
        [this](auto& attrs) {
            using T = std::decay_t<decltype(attrs)>;
            if constexpr (std::is_same_v<T, graph::TransformerAttributes>) {
                attrs.upstream_voltage = voltages_.high;
                attrs.downstream_voltage = voltages_.step_down(voltages_.high);
                attrs.phase_count = 3;
            } else if constexpr (std::is_same_v<T, graph::LoadAttributes>) {
                attrs.upstream_voltage = voltages_.low;
                attrs.phase_count = 1;
            } else {
                attrs.upstream_voltage = voltages_.medium;
                attrs.downstream_voltage = voltages_.medium;
                attrs.phase_count = voltages_.medium > config_.single_phase_limit ? 3 : 1;
            }
        },
        node.attributes);
}

void VoltagePropagator::assign_from(Node const& source, Node& target) const {
    Float const supply = graph::downstream_voltage(source);
    std::visit(
        [this, supply](auto& attrs) {
            using T = std::decay_t<decltype(attrs)>;
            if constexpr (std::is_same_v<T, graph::TransformerAttributes>) {
                attrs.upstream_voltage = supply;
                attrs.downstream_voltage = voltages_.step_down(supply);
                attrs.phase_count = 3;
            } else if constexpr (std::is_same_v<T, graph::LoadAttributes>) {
                attrs.upstream_voltage = voltages_.low;
                attrs.phase_count = 1;
            } else {
                Float const snapped = voltages_.nearest(supply);
                attrs.upstream_voltage = snapped;
                attrs.downstream_voltage = snapped;
                attrs.phase_count = snapped > config_.single_phase_limit ? 3 : 1;
            }
        },
        target.attributes);
}

void VoltagePropagator::update_currents(Node& node) const {
    Float const pf = config_.power_factor;
    std::visit(
        [&](auto& attrs) {
            using T = std::decay_t<decltype(attrs)>;
            attrs.frequency = config_.frequency;
            if constexpr (std::is_same_v<T, graph::TransformerAttributes>) {
                attrs.upstream_current = line_current(node.demand, attrs.upstream_voltage, 3, pf);
                attrs.downstream_current = line_current(node.demand, attrs.downstream_voltage, 3, pf);
            } else if constexpr (std::is_same_v<T, graph::LoadAttributes>) {
                attrs.current = line_current(attrs.power, attrs.upstream_voltage, 1, attrs.power_factor);
            } else {
                attrs.current =
                    line_current(node.demand, attrs.downstream_voltage, attrs.phase_count, pf);
            }
        },
        node.attributes);
    apply_standard_sizing(node, pf);
}

void VoltagePropagator::energize_edge(Graph const& graph, graph::Edge& edge) const {
    Node const& source = graph.node(edge.source);
    Node const& target = graph.node(edge.target);

    edge.voltage = graph::downstream_voltage(source);
    edge.phase_count = edge_phase_count(target, edge.voltage);
    edge.frequency = config_.frequency;

    Float const carried = target.type == NodeType::LOAD
                              ? std::get<graph::LoadAttributes>(target.attributes).power
                              : target.demand;
    edge.apparent_current = line_current(carried, edge.voltage, edge.phase_count, config_.power_factor);
    edge.current_rating = select_distribution_size(edge.apparent_current).size;

    Float const factor = edge.phase_count == 3 ? std::sqrt(3.0) : 2.0;
    edge.voltage_drop = factor * edge.apparent_current * config_.cable_resistance * edge.cable_distance;
    edge.energized = true;
}

size_t VoltagePropagator::refresh_downstream(Graph& graph, std::string const& from) const {
    std::unordered_set<std::string> refreshed{from};
    std::deque<std::string> worklist{from};

    while (!worklist.empty()) {
        std::string const current = worklist.front();
        worklist.pop_front();

        for (auto const& next : graph.successors(current)) {
            if (!refreshed.insert(next).second) continue;
            Node& target = graph.node(next);
            assign_from(graph.node(current), target);
            update_currents(target);
            worklist.push_back(next);
        }
    }

    for (auto& edge : graph.edges()) {
        if (refreshed.count(edge.source) > 0) energize_edge(graph, edge);
    }
    return refreshed.size() - 1;
}

PropagationSummary VoltagePropagator::propagate(Graph& graph) const {
    auto& logger = logging::global_logger;
    logging::ComponentScope scope(logger, "VoltagePropagator");

    PropagationSummary summary;
    summary.sources = graph.sources();
    if (summary.sources.empty()) {
        for (auto const& node : graph.nodes()) {
            if (node.type == NodeType::TRANSFORMER && node.subtype == NodeSubtype::MAIN) {
                summary.sources.push_back(node.id);
            }
        }
        LOG_WARN(logger, "No in-degree 0 node; seeding from", summary.sources.size(),
                 "main transformers");
    }

    for (auto& node : graph.nodes()) {
        node.state = NodeState::PROVISIONAL;
        node.demand = 0.0;
    }
    for (auto& edge : graph.edges()) {
        edge.energized = false;
    }

    std::unordered_map<std::string, std::vector<size_t>> outgoing;
    for (size_t e = 0; e < graph.edges().size(); ++e) {
        outgoing[graph.edges()[e].source].push_back(e);
    }

    std::unordered_set<std::string> visited;
    std::deque<std::string> worklist;
    std::vector<std::string> order;

    for (auto const& id : summary.sources) {
        if (!visited.insert(id).second) continue;
        seed_source(graph.node(id));
        worklist.push_back(id);
    }

    while (!worklist.empty()) {
        std::string const current = worklist.front();
        worklist.pop_front();
        order.push_back(current);

        auto it = outgoing.find(current);
        if (it == outgoing.end()) continue;

        for (size_t e : it->second) {
            auto& edge = graph.edges()[e];
            Node const& source = graph.node(current);
            Node& target = graph.node(edge.target);

            edge.voltage = graph::downstream_voltage(source);
            edge.phase_count = edge_phase_count(target, edge.voltage);

            if (visited.insert(edge.target).second) {
                assign_from(source, target);
                worklist.push_back(edge.target);
                LOG_TRACE(logger, "Assigned", target.id, "from", source.id, "at", edge.voltage, "V");
            }
        }
    }

    // Demand roll-up over the reached subgraph in topological order, leaves first. A node fed
    // from several reached nodes splits its demand evenly between them. Nodes on a cycle never
    // reach in-degree 0 and are appended in discovery order.
    std::unordered_map<std::string, size_t> feed_count;
    for (auto const& edge : graph.edges()) {
        if (visited.count(edge.source) > 0) ++feed_count[edge.target];
    }

    std::unordered_map<std::string, size_t> remaining = feed_count;
    std::vector<std::string> topological;
    std::deque<std::string> ready;
    for (auto const& id : order) {
        if (remaining[id] == 0) ready.push_back(id);
    }
    std::unordered_set<std::string> placed;
    while (!ready.empty()) {
        std::string const current = ready.front();
        ready.pop_front();
        topological.push_back(current);
        placed.insert(current);

        auto out = outgoing.find(current);
        if (out == outgoing.end()) continue;
        for (size_t e : out->second) {
            auto const& target = graph.edges()[e].target;
            if (--remaining[target] == 0) ready.push_back(target);
        }
    }
    for (auto const& id : order) {
        if (placed.count(id) == 0) topological.push_back(id);
    }

    for (auto it = topological.rbegin(); it != topological.rend(); ++it) {
        Node& node = graph.node(*it);
        Float demand = 0.0;
        if (auto const* load = std::get_if<graph::LoadAttributes>(&node.attributes)) {
            demand = load->power;
        }
        auto out = outgoing.find(node.id);
        if (out != outgoing.end()) {
            for (size_t e : out->second) {
                auto const& target = graph.edges()[e].target;
                demand += graph.node(target).demand / static_cast<Float>(feed_count[target]);
            }
        }
        node.demand = demand;
    }

    for (auto const& id : order) {
        Node& node = graph.node(id);
        update_currents(node);
        node.state = NodeState::ENERGIZED;
    }
    summary.energized_nodes = order.size();

    for (auto& edge : graph.edges()) {
        if (visited.count(edge.source) == 0) continue;
        energize_edge(graph, edge);
        ++summary.energized_edges;
    }

    summary.unreached_nodes = graph.node_count() - summary.energized_nodes;
    if (summary.unreached_nodes > 0) {
        LOG_WARN(logger, "Nodes not reachable from any source:", summary.unreached_nodes);
    }

    LOG_INFO(logger, "Energized", summary.energized_nodes, "nodes and", summary.energized_edges,
             "edges from", summary.sources.size(), "sources");
    return summary;
}

}  // namespace mepg::electrical
