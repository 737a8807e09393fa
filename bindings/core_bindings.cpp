/**
 * @file core_bindings.cpp
 * @brief Core type bindings for MEPG
 */

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "mepg/core/synthesizer.h"
#include "mepg/core/types.h"
#include "mepg/electrical/constraint_validator.h"
#include "mepg/graph/graph.h"

namespace py = pybind11;
using namespace mepg;

void init_core_types(pybind11::module& m) {
    // Enumerations
    py::enum_<NodeType>(m, "NodeType")
        .value("TRANSFORMER", NodeType::TRANSFORMER, "Step-down transformer")
        .value("SWITCHBOARD", NodeType::SWITCHBOARD, "Main switchboard")
        .value("PANELBOARD", NodeType::PANELBOARD, "Distribution or branch panelboard")
        .value("LOAD", NodeType::LOAD, "End load")
        .export_values();

    py::enum_<NodeSubtype>(m, "NodeSubtype")
        .value("MAIN", NodeSubtype::MAIN)
        .value("SECONDARY", NodeSubtype::SECONDARY)
        .value("DISTRIBUTION", NodeSubtype::DISTRIBUTION)
        .value("LIGHTING", NodeSubtype::LIGHTING)
        .value("POWER", NodeSubtype::POWER)
        .value("GENERIC", NodeSubtype::GENERIC)
        .value("END_LOAD", NodeSubtype::END_LOAD)
        .export_values();

    py::enum_<LoadType>(m, "LoadType")
        .value("MAIN_SERVICE", LoadType::MAIN_SERVICE)
        .value("HVAC", LoadType::HVAC)
        .value("LIGHTING", LoadType::LIGHTING)
        .value("GENERAL_POWER", LoadType::GENERAL_POWER)
        .value("KITCHEN", LoadType::KITCHEN)
        .value("DATA_CENTER", LoadType::DATA_CENTER);

    py::enum_<CoreStrategyKind>(m, "CoreStrategyKind")
        .value("SINGLE_CORE", CoreStrategyKind::SINGLE_CORE)
        .value("DUAL_CORE", CoreStrategyKind::DUAL_CORE)
        .value("MULTI_CORE", CoreStrategyKind::MULTI_CORE)
        .export_values();

    py::enum_<OutputFormat>(m, "OutputFormat")
        .value("GRAPHML", OutputFormat::GRAPHML, "GraphML written with the .mepg extension")
        .value("JSON", OutputFormat::JSON, "Node-link JSON")
        .export_values();

    // Building input
    py::class_<Point3>(m, "Point3")
        .def(py::init<>())
        .def_readwrite("x", &Point3::x)
        .def_readwrite("y", &Point3::y)
        .def_readwrite("z", &Point3::z);

    py::class_<CoreFootprint>(m, "CoreFootprint")
        .def(py::init<>())
        .def_readwrite("x_center", &CoreFootprint::x_center, "Core center x (m)")
        .def_readwrite("y_center", &CoreFootprint::y_center, "Core center y (m)")
        .def_readwrite("size", &CoreFootprint::size, "Core side length (m)");

    py::class_<BuildingParameters>(m, "BuildingParameters")
        .def(py::init<>())
        .def_readwrite("length", &BuildingParameters::length, "Footprint extent along x (m)")
        .def_readwrite("width", &BuildingParameters::width, "Footprint extent along y (m)")
        .def_readwrite("floor_height", &BuildingParameters::floor_height,
                       "Floor-to-floor height (m)")
        .def_readwrite("floor_count", &BuildingParameters::floor_count, "Floors above grade")
        .def_readwrite("basement_depth", &BuildingParameters::basement_depth,
                       "Basement depth (m)")
        .def_readwrite("core", &BuildingParameters::core, "Electrical core footprint")
        .def("__repr__", [](BuildingParameters const& p) {
            return "<BuildingParameters " + std::to_string(p.length) + "x" +
                   std::to_string(p.width) + "m floors=" + std::to_string(p.floor_count) + ">";
        });

    py::class_<CorePosition>(m, "CorePosition")
        .def_readonly("x_center", &CorePosition::x_center)
        .def_readonly("y_center", &CorePosition::y_center)
        .def_readonly("core_id", &CorePosition::core_id);

    py::class_<CoreStrategy>(m, "CoreStrategy")
        .def_readonly("kind", &CoreStrategy::kind)
        .def_readonly("num_cores", &CoreStrategy::num_cores)
        .def_readonly("positions", &CoreStrategy::positions);

    py::class_<core::SynthesisConfig>(m, "SynthesisConfig")
        .def(py::init<>())
        .def_readwrite("construction_year", &core::SynthesisConfig::construction_year)
        .def_readwrite("target_total_load", &core::SynthesisConfig::target_total_load,
                       "Scale distributed loads to this total (kW); 0 disables")
        .def_readwrite("frequency", &core::SynthesisConfig::frequency)
        .def_readwrite("power_factor", &core::SynthesisConfig::power_factor)
        .def_readwrite("description", &core::SynthesisConfig::description);

    // Graph inspection
    py::enum_<graph::NodeState>(m, "NodeState")
        .value("PROVISIONAL", graph::NodeState::PROVISIONAL)
        .value("ENERGIZED", graph::NodeState::ENERGIZED)
        .export_values();

    py::class_<graph::Node>(m, "Node")
        .def_readonly("id", &graph::Node::id)
        .def_readonly("type", &graph::Node::type)
        .def_readonly("subtype", &graph::Node::subtype)
        .def_readonly("location", &graph::Node::location)
        .def_readonly("floor", &graph::Node::floor)
        .def_readonly("room", &graph::Node::room)
        .def_readonly("capacity", &graph::Node::capacity, "Planned capacity (kW)")
        .def_readonly("demand", &graph::Node::demand, "Downstream demand (kW)")
        .def_readonly("manufacturer", &graph::Node::manufacturer)
        .def_readonly("replacement_cost", &graph::Node::replacement_cost)
        .def_readonly("risk_score", &graph::Node::risk_score)
        .def_readonly("state", &graph::Node::state)
        .def_property_readonly("upstream_voltage",
                               [](graph::Node const& n) { return graph::upstream_voltage(n); })
        .def_property_readonly("downstream_voltage",
                               [](graph::Node const& n) { return graph::downstream_voltage(n); })
        .def_property_readonly("phase_count",
                               [](graph::Node const& n) { return graph::phase_count(n); })
        .def("__repr__", [](graph::Node const& n) {
            return "<Node id=" + n.id + " floor=" + std::to_string(n.floor) + ">";
        });

    py::class_<graph::Edge>(m, "Edge")
        .def_readonly("source", &graph::Edge::source)
        .def_readonly("target", &graph::Edge::target)
        .def_readonly("voltage", &graph::Edge::voltage)
        .def_readonly("current_rating", &graph::Edge::current_rating)
        .def_readonly("phase_count", &graph::Edge::phase_count)
        .def_readonly("apparent_current", &graph::Edge::apparent_current)
        .def_readonly("voltage_drop", &graph::Edge::voltage_drop)
        .def_readonly("cable_distance", &graph::Edge::cable_distance)
        .def_readonly("load_classification", &graph::Edge::load_classification)
        .def("__repr__", [](graph::Edge const& e) {
            return "<Edge " + e.source + "->" + e.target + ">";
        });

    py::class_<graph::GraphMetadata>(m, "GraphMetadata")
        .def_readonly("generation_id", &graph::GraphMetadata::generation_id)
        .def_readonly("seed", &graph::GraphMetadata::seed)
        .def_readonly("core_strategy", &graph::GraphMetadata::core_strategy)
        .def_readonly("high_voltage", &graph::GraphMetadata::high_voltage)
        .def_readonly("total_demand", &graph::GraphMetadata::total_demand)
        .def_readonly("timestamp", &graph::GraphMetadata::timestamp);

    py::class_<graph::Graph>(m, "Graph")
        .def_property_readonly("nodes", [](graph::Graph const& g) { return g.nodes(); })
        .def_property_readonly("edges", [](graph::Graph const& g) { return g.edges(); })
        .def_property_readonly("metadata", [](graph::Graph const& g) { return g.metadata(); })
        .def("node", py::overload_cast<std::string const&>(&graph::Graph::node, py::const_),
             py::return_value_policy::copy, py::arg("id"))
        .def("has_node", &graph::Graph::has_node, py::arg("id"))
        .def("has_edge", &graph::Graph::has_edge, py::arg("source"), py::arg("target"))
        .def("predecessors", &graph::Graph::predecessors, py::arg("id"))
        .def("successors", &graph::Graph::successors, py::arg("id"))
        .def("sources", &graph::Graph::sources)
        .def("node_count", &graph::Graph::node_count)
        .def("edge_count", &graph::Graph::edge_count);

    // Validation results
    py::enum_<electrical::Severity>(m, "Severity")
        .value("WARNING", electrical::Severity::WARNING)
        .value("REPAIRED", electrical::Severity::REPAIRED)
        .export_values();

    py::class_<electrical::ValidationRecord>(m, "ValidationRecord")
        .def_readonly("rule", &electrical::ValidationRecord::rule)
        .def_readonly("severity", &electrical::ValidationRecord::severity)
        .def_readonly("node_id", &electrical::ValidationRecord::node_id)
        .def_readonly("before", &electrical::ValidationRecord::before)
        .def_readonly("after", &electrical::ValidationRecord::after)
        .def_readonly("message", &electrical::ValidationRecord::message);

    py::class_<electrical::ValidationReport>(m, "ValidationReport")
        .def_readonly("records", &electrical::ValidationReport::records)
        .def_readonly("structure_changed", &electrical::ValidationReport::structure_changed)
        .def("warning_count", &electrical::ValidationReport::warning_count)
        .def("repair_count", &electrical::ValidationReport::repair_count)
        .def("clean", &electrical::ValidationReport::clean);

    py::class_<core::SynthesisResult>(m, "SynthesisResult")
        .def_readonly("graph", &core::SynthesisResult::graph)
        .def_readonly("core_strategy", &core::SynthesisResult::core_strategy)
        .def_readonly("requirement_count", &core::SynthesisResult::requirement_count)
        .def_readonly("validation", &core::SynthesisResult::validation)
        .def_readonly("seed", &core::SynthesisResult::seed);
}
