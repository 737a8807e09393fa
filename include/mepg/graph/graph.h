#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <variant>
#include <vector>

#include "mepg/core/types.h"

namespace mepg::graph {

/**
 * @brief Node lifecycle: structural attributes only, then electrically resolved
 */
enum class NodeState {
    PROVISIONAL = 0,
    ENERGIZED = 1
};

struct TransformerAttributes {
    Float upstream_voltage = 0.0;           // Primary side (V)
    Float downstream_voltage = 0.0;         // Secondary side (V)
    int phase_count = 3;
    Float frequency = 0.0;                  // Hz
    Float upstream_current = 0.0;           // A
    Float downstream_current = 0.0;         // A
    Float upstream_current_rating = 0.0;    // Standard size (A)
    Float downstream_current_rating = 0.0;  // Standard size (A)
    Float short_circuit_rating = 0.0;       // kA
    Float nominal_power = 0.0;              // Standard size (kVA)
    Float impedance = 0.0;                  // Percent
    std::string cooling;
};

struct SwitchboardAttributes {
    Float upstream_voltage = 0.0;
    Float downstream_voltage = 0.0;
    int phase_count = 3;
    Float frequency = 0.0;
    Float current = 0.0;            // A
    Float bus_rating = 0.0;         // Standard size (A)
    Float short_circuit_rating = 0.0;
    int section_count = 1;
};

struct PanelboardAttributes {
    Float upstream_voltage = 0.0;
    Float downstream_voltage = 0.0;
    int phase_count = 3;
    Float frequency = 0.0;
    Float current = 0.0;
    Float current_rating = 0.0;        // Standard size (A)
    int circuit_count = 0;
    std::string mounting;
    bool rated_as_switchboard = false;  // Rating above the panelboard maximum
};

struct LoadAttributes {
    Float upstream_voltage = 0.0;
    int phase_count = 1;
    Float frequency = 0.0;
    Float current = 0.0;
    Float power = 0.0;  // kW
    Float power_factor = 0.9;
    LoadType load_type = LoadType::GENERAL_POWER;
    int priority = 3;
};

using NodeAttributes =
    std::variant<TransformerAttributes, SwitchboardAttributes, PanelboardAttributes, LoadAttributes>;

/**
 * @brief Physical size of the equipment enclosure (mm)
 */
struct Dimensions {
    Float width = 0.0;
    Float height = 0.0;
    Float depth = 0.0;
};

/**
 * @brief Baseline maintenance attributes for new construction
 */
struct Lifecycle {
    int installation_year = 0;
    int manufacture_year = 0;
    int expected_lifespan = 0;            // Years
    int maintenance_interval = 0;         // Months
    Float mean_time_to_failure = 0.0;     // Hours
    Float operating_hours = 0.0;
    int failure_count = 0;
};

struct Node {
    std::string id;  // type_NNN
    NodeType type = NodeType::LOAD;
    NodeSubtype subtype = NodeSubtype::END_LOAD;
    Point3 location;
    int floor = 0;
    std::string room;
    Float capacity = 0.0;  // Planned capacity (kW)
    std::string manufacturer;
    Dimensions dimensions;
    Lifecycle lifecycle;
    Float demand = 0.0;            // Downstream end-load demand (kW)
    Float replacement_cost = 0.0;  // USD
    Float risk_score = 0.0;
    NodeState state = NodeState::PROVISIONAL;
    NodeAttributes attributes;
};

struct Edge {
    std::string source;
    std::string target;
    std::string connection_type = "power";
    Float voltage = 0.0;           // Source downstream voltage (V)
    Float current_rating = 0.0;    // Standard size (A)
    int phase_count = 0;
    Float frequency = 0.0;
    Float apparent_current = 0.0;  // A
    Float voltage_drop = 0.0;      // V
    Float cable_distance = 0.0;    // m
    std::string load_classification;
    bool energized = false;
};

/**
 * @brief Graph-level metadata written with the persisted graph
 */
struct GraphMetadata {
    std::string generation_id;
    std::uint64_t seed = 0;
    Float building_length = 0.0;
    Float building_width = 0.0;
    Float floor_height = 0.0;
    int floor_count = 0;
    Float basement_depth = 0.0;
    std::string core_strategy;
    Float high_voltage = 0.0;
    Float total_demand = 0.0;
    int construction_year = 0;
    std::string timestamp;
    std::string description;
};

/**
 * @brief Directed attributed graph of distribution equipment
 *
 * Nodes keep their insertion order, which is also their identity order within
 * a type. Parallel edges are not allowed.
 */
class Graph {
  public:
    /**
     * @brief Add a node
     * @throws std::invalid_argument if the id already exists
     */
    Node& add_node(Node node);

    bool has_node(std::string const& id) const;

    /**
     * @throws std::out_of_range if the id is unknown
     */
    Node& node(std::string const& id);
    Node const& node(std::string const& id) const;

    /**
     * @brief Insertion position of a node, used for deterministic tie breaks
     */
    size_t node_index(std::string const& id) const;

    std::vector<Node>& nodes() noexcept { return nodes_; }
    std::vector<Node> const& nodes() const noexcept { return nodes_; }

    /**
     * @brief Add an edge between existing nodes
     * @throws std::invalid_argument if an endpoint is missing or the edge exists
     */
    Edge& add_edge(Edge edge);

    bool has_edge(std::string const& source, std::string const& target) const;
    bool remove_edge(std::string const& source, std::string const& target);

    Edge* find_edge(std::string const& source, std::string const& target);
    Edge const* find_edge(std::string const& source, std::string const& target) const;

    std::vector<Edge>& edges() noexcept { return edges_; }
    std::vector<Edge> const& edges() const noexcept { return edges_; }

    std::vector<std::string> predecessors(std::string const& id) const;
    std::vector<std::string> successors(std::string const& id) const;
    size_t in_degree(std::string const& id) const;
    size_t out_degree(std::string const& id) const;

    /**
     * @brief Nodes with no incoming edge, in insertion order
     */
    std::vector<std::string> sources() const;

    size_t node_count() const noexcept { return nodes_.size(); }
    size_t edge_count() const noexcept { return edges_.size(); }

    GraphMetadata& metadata() noexcept { return metadata_; }
    GraphMetadata const& metadata() const noexcept { return metadata_; }

  private:
    std::vector<Node> nodes_;
    std::unordered_map<std::string, size_t> index_;
    std::vector<Edge> edges_;
    GraphMetadata metadata_;
};

/**
 * @brief Voltage on the supply side of a node
 */
inline Float upstream_voltage(Node const& node) {
    return std::visit([](auto const& attrs) { return attrs.upstream_voltage; }, node.attributes);
}

/**
 * @brief Voltage a node hands to its successors; loads report their supply voltage
 */
inline Float downstream_voltage(Node const& node) {
    return std::visit(
        [](auto const& attrs) -> Float {
            using T = std::decay_t<decltype(attrs)>;
            if constexpr (std::is_same_v<T, LoadAttributes>) {
                return attrs.upstream_voltage;
            } else {
                return attrs.downstream_voltage;
            }
        },
        node.attributes);
}

inline int phase_count(Node const& node) {
    return std::visit([](auto const& attrs) { return attrs.phase_count; }, node.attributes);
}

/**
 * @brief Nearest panelboard to a point by 3-D distance
 *
 * Ties go to the panelboard inserted first. Returns std::nullopt when the graph
 * holds no panelboard.
 */
std::optional<std::string> nearest_panelboard(Graph const& graph, Point3 const& location);

}  // namespace mepg::graph
