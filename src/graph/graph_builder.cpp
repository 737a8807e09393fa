#include "mepg/graph/graph_builder.h"

#include <cstdio>
#include <map>
#include <set>

#include "mepg/electrical/equipment_sizing.h"
#include "mepg/logging/logger.h"

namespace mepg::graph {

namespace {

std::vector<std::string> const EQUIPMENT_MANUFACTURERS = {"Eaton", "Schneider Electric", "Siemens",
                                                          "ABB", "GE Industrial"};
std::vector<std::string> const LOAD_MANUFACTURERS = {"Trane", "Carrier", "Acuity Brands",
                                                     "Hubbell", "Vertiv", "Hobart"};
std::vector<Float> const SHORT_CIRCUIT_RATINGS = {10, 14, 18, 22, 25, 35, 42, 50, 65};  // kA
std::vector<int> const CIRCUIT_COUNTS = {12, 18, 24, 30, 42};
std::vector<std::string> const COOLING_CLASSES = {"AN", "AF", "ONAN"};
std::vector<std::string> const MOUNTINGS = {"surface", "flush"};

struct DimensionRange {
    Float min_width, max_width;
    Float min_height, max_height;
    Float min_depth, max_depth;
};

DimensionRange dimension_range(NodeType type) {
    switch (type) {
        case NodeType::TRANSFORMER:
            return {1200, 2400, 1500, 2500, 1000, 1800};
        case NodeType::SWITCHBOARD:
            return {900, 3600, 2200, 2400, 900, 1500};
        case NodeType::PANELBOARD:
            return {500, 900, 1000, 1800, 150, 250};
        case NodeType::LOAD:
        default:
            return {300, 1500, 300, 2000, 300, 1200};
    }
}

}  // namespace

std::string make_node_id(NodeType type, int number) {
    char digits[16];
    std::snprintf(digits, sizeof(digits), "%03d", number);
    return node_type_to_string(type) + "_" + digits;
}

bool GraphBuilder::connect(Graph& graph, std::string const& source, std::string const& target,
                           std::string const& label) {
    if (graph.has_edge(source, target)) return false;

    Edge edge;
    edge.source = source;
    edge.target = target;
    edge.cable_distance = distance(graph.node(source).location, graph.node(target).location);
    edge.load_classification = label;
    graph.add_edge(std::move(edge));
    return true;
}

Node GraphBuilder::make_node(NodeDecision const& decision, std::string id, RandomSource& rng) const {
    Node node;
    node.id = std::move(id);
    node.type = decision.type;
    node.subtype = decision.subtype;
    node.location = decision.location;
    node.floor = decision.floor;
    node.room = decision.room;
    node.capacity = decision.capacity_kw;
    node.state = NodeState::PROVISIONAL;

    node.manufacturer =
        rng.choice(decision.type == NodeType::LOAD ? LOAD_MANUFACTURERS : EQUIPMENT_MANUFACTURERS);
    auto const range = dimension_range(decision.type);
    node.dimensions.width = rng.uniform(range.min_width, range.max_width);
    node.dimensions.height = rng.uniform(range.min_height, range.max_height);
    node.dimensions.depth = rng.uniform(range.min_depth, range.max_depth);

    switch (decision.type) {
        case NodeType::TRANSFORMER: {
            TransformerAttributes attrs;
            attrs.short_circuit_rating = rng.choice(SHORT_CIRCUIT_RATINGS);
            attrs.impedance = rng.uniform(4.0, 6.5);
            attrs.cooling = rng.choice(COOLING_CLASSES);
            node.attributes = attrs;
            break;
        }
        case NodeType::SWITCHBOARD: {
            SwitchboardAttributes attrs;
            attrs.short_circuit_rating = rng.choice(SHORT_CIRCUIT_RATINGS);
            attrs.section_count = rng.uniform_int(1, 4);
            node.attributes = attrs;
            break;
        }
        case NodeType::PANELBOARD: {
            PanelboardAttributes attrs;
            attrs.circuit_count = rng.choice(CIRCUIT_COUNTS);
            attrs.mounting = rng.choice(MOUNTINGS);
            node.attributes = attrs;
            break;
        }
        case NodeType::LOAD: {
            LoadAttributes attrs;
            attrs.power = decision.capacity_kw;
            attrs.power_factor = config_.power_factor;
            attrs.load_type = decision.load_type.value_or(LoadType::GENERAL_POWER);
            attrs.priority = decision.priority;
            node.attributes = attrs;
            break;
        }
    }

    auto const baseline = electrical::lifecycle_baseline(decision.type, decision.subtype);
    node.lifecycle.installation_year = config_.construction_year;
    node.lifecycle.manufacture_year = config_.construction_year - rng.uniform_int(0, 2);
    node.lifecycle.expected_lifespan = baseline.expected_lifespan;
    node.lifecycle.maintenance_interval = baseline.maintenance_interval;
    node.lifecycle.mean_time_to_failure = baseline.mean_time_to_failure;

    return node;
}

BuildResult GraphBuilder::build(std::vector<NodeDecision> const& decisions, RandomSource& rng) const {
    auto& logger = logging::global_logger;
    logging::ComponentScope scope(logger, "GraphBuilder");

    BuildResult result;
    Graph& graph = result.graph;
    std::map<NodeType, int> counters;

    for (auto const& decision : decisions) {
        std::string id = make_node_id(decision.type, ++counters[decision.type]);
        result.node_ids.emplace(decision.id, id);
        graph.add_node(make_node(decision, std::move(id), rng));
    }

    std::string main_transformer;
    std::string main_switchboard;
    std::vector<NodeDecision const*> secondaries;
    std::vector<NodeDecision const*> panelboards;
    std::vector<NodeDecision const*> loads;
    std::set<int> floors_with_secondary;

    for (auto const& decision : decisions) {
        auto const& id = result.node_ids.at(decision.id);
        switch (decision.type) {
            case NodeType::TRANSFORMER:
                if (decision.subtype == NodeSubtype::MAIN && main_transformer.empty()) {
                    main_transformer = id;
                } else if (decision.subtype == NodeSubtype::SECONDARY) {
                    secondaries.push_back(&decision);
                    floors_with_secondary.insert(decision.floor);
                }
                break;
            case NodeType::SWITCHBOARD:
                if (decision.subtype == NodeSubtype::MAIN && main_switchboard.empty()) {
                    main_switchboard = id;
                }
                break;
            case NodeType::PANELBOARD:
                panelboards.push_back(&decision);
                break;
            case NodeType::LOAD:
                loads.push_back(&decision);
                break;
        }
    }

    if (!main_transformer.empty() && !main_switchboard.empty()) {
        connect(graph, main_transformer, main_switchboard, "Main Service");
    }

    if (!main_switchboard.empty()) {
        for (auto const* secondary : secondaries) {
            connect(graph, main_switchboard, result.node_ids.at(secondary->id), "Main Distribution");
        }
    }

    for (auto const* secondary : secondaries) {
        for (auto const* panel : panelboards) {
            if (panel->floor == secondary->floor) {
                connect(graph, result.node_ids.at(secondary->id), result.node_ids.at(panel->id),
                        "Floor Distribution");
            }
        }
    }

    if (!main_switchboard.empty()) {
        for (auto const* panel : panelboards) {
            if (panel->floor > 0 && floors_with_secondary.count(panel->floor) == 0) {
                connect(graph, main_switchboard, result.node_ids.at(panel->id), "Main Distribution");
            }
        }
    }

    size_t unconnected = 0;
    for (auto const* load : loads) {
        auto const panel = nearest_panelboard(graph, load->location);
        if (!panel) {
            ++unconnected;
            continue;
        }
        connect(graph, *panel, result.node_ids.at(load->id),
                load_type_label(load->load_type.value_or(LoadType::GENERAL_POWER)));
    }
    if (unconnected > 0) {
        LOG_WARN(logger, "No panelboard available for", unconnected, "loads");
    }

    LOG_INFO(logger, "Built graph with", graph.node_count(), "nodes and", graph.edge_count(),
             "edges");
    return result;
}

}  // namespace mepg::graph
