#include "mepg/core/synthesizer.h"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

#include "mepg/core/errors.h"
#include "mepg/core/random_source.h"
#include "mepg/electrical/risk_scorer.h"
#include "mepg/electrical/voltage_propagator.h"
#include "mepg/graph/graph_builder.h"
#include "mepg/logging/logger.h"
#include "mepg/planning/building_profile.h"
#include "mepg/planning/core_strategy_planner.h"
#include "mepg/planning/node_decision_planner.h"
#include "mepg/planning/requirement_analyzer.h"

namespace mepg::core {

namespace {

std::string utc_timestamp(char const* format) {
    auto const now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::ostringstream oss;
    oss << std::put_time(std::gmtime(&now), format);
    return oss.str();
}

}  // namespace

SynthesisResult TopologySynthesizer::generate(BuildingParameters const& params, int node_count,
                                              std::optional<std::uint64_t> seed) const {
    if (node_count < 3) {
        throw InvalidParameter("Node count must be at least 3, got " + std::to_string(node_count));
    }
    auto const profile = planning::BuildingProfile::from_parameters(params);

    auto& logger = logging::global_logger;
    logging::ComponentScope scope(logger, "TopologySynthesizer");

    RandomSource rng(seed);
    LOG_INFO(logger, "Synthesizing", node_count, "nodes with seed", rng.seed());

    SynthesisResult result;
    result.seed = rng.seed();
    result.core_strategy = planning::CoreStrategyPlanner().plan(profile);

    auto const requirements =
        planning::RequirementAnalyzer().analyze(profile, rng, config_.target_total_load);
    result.requirement_count = requirements.size();

    auto const decisions = planning::NodeDecisionPlanner().plan(requirements, profile,
                                                                result.core_strategy, node_count, rng);

    graph::BuilderConfig builder_config;
    builder_config.construction_year = config_.construction_year;
    builder_config.power_factor = config_.power_factor;
    result.graph = graph::GraphBuilder(builder_config).build(decisions, rng).graph;

    electrical::StandardVoltages voltages;
    voltages.high = electrical::StandardVoltages::HIGH_TIER_OPTIONS[static_cast<size_t>(
        rng.uniform_int(0, static_cast<int>(electrical::StandardVoltages::HIGH_TIER_OPTIONS.size()) - 1))];

    electrical::PropagationConfig propagation_config;
    propagation_config.frequency = config_.frequency;
    propagation_config.power_factor = config_.power_factor;
    electrical::VoltagePropagator propagator(voltages, propagation_config);
    electrical::ConstraintValidator validator(propagator);

    propagator.propagate(result.graph);
    result.validation = validator.validate(result.graph);
    if (result.validation.structure_changed) {
        LOG_INFO(logger, "Structure changed during validation, propagating again");
        propagator.propagate(result.graph);
        result.validation.append(validator.validate(result.graph));
    }

    electrical::RiskScorer().apply(result.graph);

    auto& meta = result.graph.metadata();
    meta.seed = result.seed;
    meta.timestamp = utc_timestamp("%Y-%m-%dT%H:%M:%SZ");
    meta.generation_id = "mepg-" + utc_timestamp("%Y%m%d%H%M%S") + "-" + std::to_string(result.seed);
    meta.building_length = profile.length();
    meta.building_width = profile.width();
    meta.floor_height = profile.floor_height();
    meta.floor_count = profile.floor_count();
    meta.basement_depth = profile.basement_depth();
    meta.core_strategy = core_strategy_to_string(result.core_strategy.kind);
    meta.high_voltage = voltages.high;
    meta.construction_year = config_.construction_year;
    meta.description = config_.description;
    for (auto const& id : result.graph.sources()) {
        meta.total_demand += result.graph.node(id).demand;
    }

    LOG_INFO(logger, "Generated", result.graph.node_count(), "nodes,", result.graph.edge_count(),
             "edges,", result.validation.repair_count(), "repairs,",
             result.validation.warning_count(), "warnings");
    return result;
}

}  // namespace mepg::core
