#include "mepg/electrical/risk_scorer.h"
#include "mepg/electrical/voltage_propagator.h"

#include "graph_fixtures.h"
#include "test_framework.h"

using namespace mepg;
using namespace mepg::electrical;

void test_equipment_descendants() {
    auto graph = fixtures::make_chain_graph();
    ASSERT_EQ(2, RiskScorer::equipment_descendants(graph, "transformer_001"));
    ASSERT_EQ(1, RiskScorer::equipment_descendants(graph, "switchboard_001"));
    ASSERT_EQ(0, RiskScorer::equipment_descendants(graph, "panelboard_001"));
    ASSERT_EQ(0, RiskScorer::equipment_descendants(graph, "load_001"));
}

void test_risk_scores_chain() {
    auto graph = fixtures::make_chain_graph();
    VoltagePropagator(StandardVoltages{}).propagate(graph);

    // Each node carries 10 kW of a 40 kW total
    auto scores = RiskScorer().score(graph);
    ASSERT_EQ(4, scores.size());
    ASSERT_NEAR(1.0, scores.at("transformer_001"), 1e-12);
    ASSERT_NEAR(0.6, scores.at("switchboard_001"), 1e-12);
    ASSERT_NEAR(0.2, scores.at("panelboard_001"), 1e-12);
    ASSERT_NEAR(0.2, scores.at("load_001"), 1e-12);
}

void test_risk_scores_applied_to_nodes() {
    auto graph = fixtures::make_chain_graph();
    VoltagePropagator(StandardVoltages{}).propagate(graph);
    RiskScorer().apply(graph);

    ASSERT_NEAR(1.0, graph.node("transformer_001").risk_score, 1e-12);
    for (auto const& node : graph.nodes()) {
        ASSERT_TRUE(node.risk_score >= 0.0 && node.risk_score <= 1.0);
    }
}

void test_risk_scores_without_demand() {
    graph::Graph graph;
    graph.add_node(fixtures::make_node("panelboard_001", NodeType::PANELBOARD, NodeSubtype::POWER,
                                       {0.0, 0.0, 0.0}));
    auto scores = RiskScorer().score(graph);
    ASSERT_NEAR(0.0, scores.at("panelboard_001"), 1e-12);

    graph::Graph empty;
    ASSERT_TRUE(RiskScorer().score(empty).empty());
}

void register_risk_scorer_tests(TestRunner& runner) {
    runner.add_test("Equipment Descendants", test_equipment_descendants);
    runner.add_test("Risk Scores Chain", test_risk_scores_chain);
    runner.add_test("Risk Scores Applied To Nodes", test_risk_scores_applied_to_nodes);
    runner.add_test("Risk Scores Without Demand", test_risk_scores_without_demand);
}
