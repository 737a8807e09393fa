#include "mepg/io/attribute_map.h"

#include <cmath>
#include <sstream>
#include <type_traits>

#include "mepg/core/errors.h"
#include "mepg/io/io_interface.h"

namespace mepg::io {

using graph::NodeState;

AttributeList flatten_node(graph::Node const& node) {
    AttributeList attrs = {
        {"type", node_type_to_string(node.type)},
        {"subtype", node_subtype_to_string(node.subtype)},
        {"x", node.location.x},
        {"y", node.location.y},
        {"z", node.location.z},
        {"floor", node.floor},
        {"room", node.room},
        {"capacity", node.capacity},
        {"manufacturer", node.manufacturer},
        {"width", node.dimensions.width},
        {"height", node.dimensions.height},
        {"depth", node.dimensions.depth},
        {"installation_year", node.lifecycle.installation_year},
        {"manufacture_year", node.lifecycle.manufacture_year},
        {"expected_lifespan", node.lifecycle.expected_lifespan},
        {"maintenance_interval", node.lifecycle.maintenance_interval},
        {"mean_time_to_failure", node.lifecycle.mean_time_to_failure},
        {"operating_hours", node.lifecycle.operating_hours},
        {"failure_count", node.lifecycle.failure_count},
        {"demand", node.demand},
        {"replacement_cost", node.replacement_cost},
        {"risk_score", node.risk_score},
        {"state", std::string(node.state == NodeState::ENERGIZED ? "energized" : "provisional")},
    };

    std::visit(
        [&attrs](auto const& a) {
            using T = std::decay_t<decltype(a)>;
            if constexpr (std::is_same_v<T, graph::TransformerAttributes>) {
                attrs.emplace_back("upstream_voltage", a.upstream_voltage);
                attrs.emplace_back("downstream_voltage", a.downstream_voltage);
                attrs.emplace_back("phase_count", a.phase_count);
                attrs.emplace_back("frequency", a.frequency);
                attrs.emplace_back("upstream_current", a.upstream_current);
                attrs.emplace_back("downstream_current", a.downstream_current);
                attrs.emplace_back("upstream_current_rating", a.upstream_current_rating);
                attrs.emplace_back("downstream_current_rating", a.downstream_current_rating);
                attrs.emplace_back("short_circuit_rating", a.short_circuit_rating);
                attrs.emplace_back("nominal_power", a.nominal_power);
                attrs.emplace_back("impedance", a.impedance);
                attrs.emplace_back("cooling", a.cooling);
            } else if constexpr (std::is_same_v<T, graph::SwitchboardAttributes>) {
                attrs.emplace_back("upstream_voltage", a.upstream_voltage);
                attrs.emplace_back("downstream_voltage", a.downstream_voltage);
                attrs.emplace_back("phase_count", a.phase_count);
                attrs.emplace_back("frequency", a.frequency);
                attrs.emplace_back("current", a.current);
                attrs.emplace_back("bus_rating", a.bus_rating);
                attrs.emplace_back("short_circuit_rating", a.short_circuit_rating);
                attrs.emplace_back("section_count", a.section_count);
            } else if constexpr (std::is_same_v<T, graph::PanelboardAttributes>) {
                attrs.emplace_back("upstream_voltage", a.upstream_voltage);
                attrs.emplace_back("downstream_voltage", a.downstream_voltage);
                attrs.emplace_back("phase_count", a.phase_count);
                attrs.emplace_back("frequency", a.frequency);
                attrs.emplace_back("current", a.current);
                attrs.emplace_back("current_rating", a.current_rating);
                attrs.emplace_back("circuit_count", a.circuit_count);
                attrs.emplace_back("mounting", a.mounting);
                attrs.emplace_back("rated_as_switchboard", a.rated_as_switchboard);
            } else {
                attrs.emplace_back("upstream_voltage", a.upstream_voltage);
                attrs.emplace_back("phase_count", a.phase_count);
                attrs.emplace_back("frequency", a.frequency);
                attrs.emplace_back("current", a.current);
                attrs.emplace_back("power", a.power);
                attrs.emplace_back("power_factor", a.power_factor);
                attrs.emplace_back("load_type", load_type_to_string(a.load_type));
                attrs.emplace_back("priority", a.priority);
            }
        },
        node.attributes);

    return attrs;
}

AttributeList flatten_edge(graph::Edge const& edge) {
    return {
        {"connection_type", edge.connection_type},
        {"voltage", edge.voltage},
        {"current_rating", edge.current_rating},
        {"phase_count", edge.phase_count},
        {"frequency", edge.frequency},
        {"apparent_current", edge.apparent_current},
        {"voltage_drop", edge.voltage_drop},
        {"cable_distance", edge.cable_distance},
        {"load_classification", edge.load_classification},
    };
}

AttributeList flatten_metadata(graph::GraphMetadata const& metadata) {
    return {
        {"generation_id", metadata.generation_id},
        {"seed", std::to_string(metadata.seed)},
        {"building_length", metadata.building_length},
        {"building_width", metadata.building_width},
        {"floor_height", metadata.floor_height},
        {"floor_count", metadata.floor_count},
        {"basement_depth", metadata.basement_depth},
        {"core_strategy", metadata.core_strategy},
        {"high_voltage", metadata.high_voltage},
        {"total_demand", metadata.total_demand},
        {"construction_year", metadata.construction_year},
        {"timestamp", metadata.timestamp},
        {"description", metadata.description},
    };
}

std::string attribute_type(AttributeValue const& value) {
    switch (value.index()) {
        case 0:
            return "string";
        case 1:
            return "double";
        case 2:
            return "int";
        default:
            return "boolean";
    }
}

std::string attribute_text(AttributeValue const& value) {
    return std::visit(
        [](auto const& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::string>) {
                return v;
            } else if constexpr (std::is_same_v<T, bool>) {
                return v ? "true" : "false";
            } else if constexpr (std::is_same_v<T, int>) {
                return std::to_string(v);
            } else {
                if (!std::isfinite(v)) {
                    throw SerializationError("Non-finite attribute value");
                }
                std::ostringstream oss;
                oss.precision(12);
                oss << v;
                return oss.str();
            }
        },
        value);
}

void require_energized(graph::Graph const& graph) {
    for (auto const& node : graph.nodes()) {
        if (node.state != NodeState::ENERGIZED) {
            throw SerializationError("Node " + node.id + " is provisional and cannot be written");
        }
    }
    for (auto const& edge : graph.edges()) {
        if (!edge.energized) {
            throw SerializationError("Edge " + edge.source + " -> " + edge.target +
                                     " is not energized and cannot be written");
        }
    }
}

}  // namespace mepg::io
