#pragma once

#include <vector>

#include "mepg/core/random_source.h"
#include "mepg/core/types.h"
#include "mepg/planning/building_profile.h"

namespace mepg::planning {

/**
 * @brief Sizing factors and thresholds for equipment decisions
 */
struct PlannerConfig {
    Float main_service_threshold = 100.0;  // kW above which a main service is built
    Float main_transformer_factor = 1.25;
    Float main_switchboard_factor = 1.2;
    Float secondary_threshold = 75.0;      // kW of medium load above which a floor transformer is added
    Float secondary_transformer_factor = 1.3;
    Float distribution_panel_factor = 1.2;
    Float low_panel_share = 40.0;          // kW of low voltage load per panelboard
    int max_low_panels = 3;
    Float low_panel_factor = 1.25;
    Float filler_min_capacity = 20.0;      // kW
    Float filler_max_capacity = 50.0;      // kW
    Float equipment_spacing = 1.5;         // m between equipment placed at the same core
};

/**
 * @brief Turns requirements into typed equipment decisions
 */
class NodeDecisionPlanner {
  public:
    explicit NodeDecisionPlanner(PlannerConfig config = {}) : config_(config) {}

    /**
     * @brief Plan equipment and reconcile the decision count with a target
     * @param requirements Output of the requirement analyzer
     * @param profile Building the requirements belong to
     * @param strategy Core positions used to place distribution equipment
     * @param target_node_count Requested node count, at least 3
     * @param rng Shared random stream, used only when padding
     * @return Decisions with ids assigned in collection order
     * @throws InvalidParameter if target_node_count < 3
     */
    std::vector<NodeDecision> plan(std::vector<ElectricalRequirement> const& requirements,
                                   BuildingProfile const& profile, CoreStrategy const& strategy,
                                   int target_node_count, RandomSource& rng) const;

    /**
     * @brief Sum of all requirement loads except the main service
     */
    static Float estimated_total_load(std::vector<ElectricalRequirement> const& requirements);

  private:
    PlannerConfig config_;
};

}  // namespace mepg::planning
