#pragma once

#include "mepg/core/types.h"
#include "mepg/planning/building_profile.h"

namespace mepg::planning {

/**
 * @brief Thresholds of the core count rule
 */
struct CoreStrategyConfig {
    Float single_core_height = 30.0;        // Above this height one core (m)
    Float compact_aspect_ratio = 2.0;       // Below this aspect ratio a tower is compact
    int compact_min_floors = 6;             // Compact towers above this floor count use one core
    Float dual_core_min_height = 15.0;      // Dual core height band lower bound (m)
    Float dual_core_max_aspect_ratio = 3.5;
    Float area_per_core = 1200.0;           // Footprint served per core (m^2)
    int min_multi_cores = 2;
    int max_multi_cores = 4;
};

/**
 * @brief Decides how many vertical electrical cores the building needs and where
 */
class CoreStrategyPlanner {
  public:
    explicit CoreStrategyPlanner(CoreStrategyConfig config = {}) : config_(config) {}

    /**
     * @brief Derive the strategy from geometry alone; never draws randomness
     */
    CoreStrategy plan(BuildingProfile const& profile) const;

    /**
     * @brief Deterministic placement for a core count
     */
    static std::vector<CorePosition> place_cores(BuildingProfile const& profile, int num_cores);

  private:
    CoreStrategyConfig config_;
};

/**
 * @brief Core closest to a plan position; ties go to the lower core id
 */
CorePosition const& nearest_core(CoreStrategy const& strategy, Float x, Float y);

}  // namespace mepg::planning
