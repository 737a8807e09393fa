#include <algorithm>

#include "mepg/core/random_source.h"
#include "mepg/graph/graph.h"
#include "mepg/graph/graph_builder.h"
#include "mepg/planning/building_profile.h"
#include "mepg/planning/core_strategy_planner.h"
#include "mepg/planning/node_decision_planner.h"
#include "mepg/planning/requirement_analyzer.h"

#include "graph_fixtures.h"
#include "test_framework.h"

using namespace mepg;
using namespace mepg::graph;

namespace {

NodeDecision make_decision(int id, NodeType type, NodeSubtype subtype, int floor, Point3 location,
                           Float capacity = 10.0) {
    NodeDecision decision;
    decision.id = id;
    decision.type = type;
    decision.subtype = subtype;
    decision.floor = floor;
    decision.location = location;
    decision.capacity_kw = capacity;
    if (type == NodeType::LOAD) decision.load_type = LoadType::GENERAL_POWER;
    return decision;
}

}  // namespace

void test_graph_nodes_and_edges() {
    auto graph = fixtures::make_chain_graph();

    ASSERT_EQ(4, graph.node_count());
    ASSERT_EQ(3, graph.edge_count());
    ASSERT_TRUE(graph.has_node("panelboard_001"));
    ASSERT_FALSE(graph.has_node("panelboard_002"));
    ASSERT_EQ(2, graph.node_index("panelboard_001"));

    ASSERT_TRUE(graph.has_edge("switchboard_001", "panelboard_001"));
    ASSERT_FALSE(graph.has_edge("panelboard_001", "switchboard_001"));
    ASSERT_EQ(1, graph.in_degree("load_001"));
    ASSERT_EQ(0, graph.out_degree("load_001"));
    ASSERT_EQ("panelboard_001", graph.predecessors("load_001").front());
    ASSERT_EQ("switchboard_001", graph.successors("transformer_001").front());

    auto sources = graph.sources();
    ASSERT_EQ(1, sources.size());
    ASSERT_EQ("transformer_001", sources.front());

    auto const* edge = graph.find_edge("panelboard_001", "load_001");
    ASSERT_TRUE(edge != nullptr);
    ASSERT_NEAR(5.0, edge->cable_distance, 1e-12);
    ASSERT_EQ("power", edge->connection_type);
    ASSERT_EQ("Test", edge->load_classification);
}

void test_graph_rejects_invalid_changes() {
    auto graph = fixtures::make_chain_graph();

    ASSERT_THROWS(graph.add_node(fixtures::make_node("load_001", NodeType::LOAD,
                                                     NodeSubtype::END_LOAD, {0.0, 0.0, 0.0})),
                  std::invalid_argument);

    Edge dangling;
    dangling.source = "panelboard_001";
    dangling.target = "load_999";
    ASSERT_THROWS(graph.add_edge(dangling), std::invalid_argument);

    Edge duplicate;
    duplicate.source = "panelboard_001";
    duplicate.target = "load_001";
    ASSERT_THROWS(graph.add_edge(duplicate), std::invalid_argument);

    ASSERT_THROWS(graph.node("load_999"), std::out_of_range);
    ASSERT_FALSE(GraphBuilder::connect(graph, "panelboard_001", "load_001", "Again"));
}

void test_graph_remove_edge() {
    auto graph = fixtures::make_chain_graph();
    ASSERT_TRUE(graph.remove_edge("panelboard_001", "load_001"));
    ASSERT_FALSE(graph.remove_edge("panelboard_001", "load_001"));
    ASSERT_EQ(2, graph.edge_count());

    // The load becomes a second source
    ASSERT_EQ(2, graph.sources().size());
}

void test_nearest_panelboard_tie_break() {
    Graph graph;
    graph.add_node(fixtures::make_node("panelboard_001", NodeType::PANELBOARD, NodeSubtype::POWER,
                                       {0.0, 0.0, 0.0}));
    graph.add_node(fixtures::make_node("panelboard_002", NodeType::PANELBOARD, NodeSubtype::POWER,
                                       {10.0, 0.0, 0.0}));

    ASSERT_EQ("panelboard_001", *nearest_panelboard(graph, {5.0, 0.0, 0.0}));
    ASSERT_EQ("panelboard_002", *nearest_panelboard(graph, {6.0, 0.0, 0.0}));

    Graph empty;
    ASSERT_FALSE(nearest_panelboard(empty, {0.0, 0.0, 0.0}).has_value());
}

void test_node_id_format() {
    ASSERT_EQ("panelboard_003", make_node_id(NodeType::PANELBOARD, 3));
    ASSERT_EQ("transformer_001", make_node_id(NodeType::TRANSFORMER, 1));
    ASSERT_EQ("load_120", make_node_id(NodeType::LOAD, 120));
}

void test_builder_hierarchy_edges() {
    std::vector<NodeDecision> decisions = {
        make_decision(1, NodeType::TRANSFORMER, NodeSubtype::MAIN, 0, {10.0, 10.0, -4.0}, 300.0),
        make_decision(2, NodeType::SWITCHBOARD, NodeSubtype::MAIN, 0, {10.0, 10.0, -4.0}, 280.0),
        make_decision(3, NodeType::TRANSFORMER, NodeSubtype::SECONDARY, 2, {10.0, 10.0, 3.5}, 100.0),
        make_decision(4, NodeType::PANELBOARD, NodeSubtype::DISTRIBUTION, 2, {11.5, 10.0, 3.5}, 90.0),
        make_decision(5, NodeType::PANELBOARD, NodeSubtype::POWER, 1, {10.0, 10.0, 0.0}, 40.0),
        make_decision(6, NodeType::LOAD, NodeSubtype::END_LOAD, 2, {15.0, 12.0, 3.5}, 25.0),
        make_decision(7, NodeType::LOAD, NodeSubtype::END_LOAD, 1, {4.0, 2.0, 0.0}, 12.0),
    };

    RandomSource rng(9);
    auto result = GraphBuilder().build(decisions, rng);
    auto const& graph = result.graph;

    ASSERT_EQ(7, graph.node_count());
    ASSERT_EQ("transformer_001", result.node_ids.at(1));
    ASSERT_EQ("switchboard_001", result.node_ids.at(2));
    ASSERT_EQ("transformer_002", result.node_ids.at(3));
    ASSERT_EQ("panelboard_001", result.node_ids.at(4));
    ASSERT_EQ("panelboard_002", result.node_ids.at(5));
    ASSERT_EQ("load_001", result.node_ids.at(6));
    ASSERT_EQ("load_002", result.node_ids.at(7));

    ASSERT_EQ(6, graph.edge_count());
    ASSERT_EQ("Main Service", graph.find_edge("transformer_001", "switchboard_001")->load_classification);
    ASSERT_EQ("Main Distribution",
              graph.find_edge("switchboard_001", "transformer_002")->load_classification);
    ASSERT_EQ("Floor Distribution",
              graph.find_edge("transformer_002", "panelboard_001")->load_classification);
    ASSERT_EQ("Main Distribution",
              graph.find_edge("switchboard_001", "panelboard_002")->load_classification);
    ASSERT_EQ("General Power", graph.find_edge("panelboard_001", "load_001")->load_classification);
    ASSERT_TRUE(graph.has_edge("panelboard_002", "load_002"));

    // Floor 2 has a secondary transformer, so the main switchboard does not feed its panel
    ASSERT_FALSE(graph.has_edge("switchboard_001", "panelboard_001"));
}

void test_builder_node_attributes() {
    std::vector<NodeDecision> decisions = {
        make_decision(1, NodeType::PANELBOARD, NodeSubtype::POWER, 1, {0.0, 0.0, 0.0}, 40.0),
        make_decision(2, NodeType::LOAD, NodeSubtype::END_LOAD, 1, {2.0, 0.0, 0.0}, 12.0),
    };

    BuilderConfig config;
    config.construction_year = 2030;
    RandomSource rng(3);
    auto graph = GraphBuilder(config).build(decisions, rng).graph;

    for (auto const& node : graph.nodes()) {
        ASSERT_EQ(NodeState::PROVISIONAL, node.state);
        ASSERT_EQ(2030, node.lifecycle.installation_year);
        ASSERT_TRUE(node.lifecycle.manufacture_year >= 2028 && node.lifecycle.manufacture_year <= 2030);
        ASSERT_TRUE(node.lifecycle.expected_lifespan > 0);
        ASSERT_FALSE(node.manufacturer.empty());
        ASSERT_TRUE(node.dimensions.width > 0.0);
    }

    auto const& panel = graph.node("panelboard_001");
    auto const& panel_attrs = std::get<PanelboardAttributes>(panel.attributes);
    ASSERT_TRUE(panel_attrs.circuit_count >= 12 && panel_attrs.circuit_count <= 42);
    ASSERT_NEAR(40.0, panel.capacity, 1e-12);

    auto const& load = graph.node("load_001");
    auto const& load_attrs = std::get<LoadAttributes>(load.attributes);
    ASSERT_NEAR(12.0, load_attrs.power, 1e-12);
    ASSERT_EQ(LoadType::GENERAL_POWER, load_attrs.load_type);
}

void test_builder_minimal_building_sources() {
    BuildingParameters params;
    params.length = 20.0;
    params.width = 20.0;
    params.floor_count = 3;
    auto profile = planning::BuildingProfile::from_parameters(params);
    RandomSource rng(1);
    auto strategy = planning::CoreStrategyPlanner().plan(profile);
    auto requirements = planning::RequirementAnalyzer().analyze(profile, rng);
    auto decisions = planning::NodeDecisionPlanner().plan(requirements, profile, strategy, 10, rng);
    auto graph = GraphBuilder().build(decisions, rng).graph;

    ASSERT_EQ(10, graph.node_count());
    // T -> SB, SB -> four above grade panels, three loads
    ASSERT_EQ(8, graph.edge_count());

    auto sources = graph.sources();
    ASSERT_EQ(2, sources.size());
    ASSERT_EQ("transformer_001", sources[0]);
    ASSERT_EQ("panelboard_001", sources[1]);

    for (auto const& node : graph.nodes()) {
        if (node.type != NodeType::LOAD) continue;
        auto feeds = graph.predecessors(node.id);
        ASSERT_EQ(1, feeds.size());
        ASSERT_EQ(NodeType::PANELBOARD, graph.node(feeds.front()).type);
    }
}

void register_graph_tests(TestRunner& runner) {
    runner.add_test("Graph Nodes And Edges", test_graph_nodes_and_edges);
    runner.add_test("Graph Rejects Invalid Changes", test_graph_rejects_invalid_changes);
    runner.add_test("Graph Remove Edge", test_graph_remove_edge);
    runner.add_test("Nearest Panelboard Tie Break", test_nearest_panelboard_tie_break);
    runner.add_test("Node Id Format", test_node_id_format);
    runner.add_test("Builder Hierarchy Edges", test_builder_hierarchy_edges);
    runner.add_test("Builder Node Attributes", test_builder_node_attributes);
    runner.add_test("Builder Minimal Building Sources", test_builder_minimal_building_sources);
}
