#pragma once

#include <vector>

#include "mepg/core/random_source.h"
#include "mepg/core/types.h"
#include "mepg/planning/building_profile.h"

namespace mepg::planning {

/**
 * @brief Load densities and fixed loads used to size requirements
 */
struct LoadDensities {
    Float main_service = 5.0;   // W/sqft
    Float hvac = 2.5;           // W/sqft
    Float lighting = 1.5;       // W/sqft
    Float general_power = 3.0;  // W/sqft
    Float kitchen = 25.0;       // kW per kitchen
    Float data_center = 50.0;   // kW on the top floor
    int kitchen_interval = 3;   // Every n-th floor above grade has a kitchen
};

/**
 * @brief Turns a building profile into discrete electrical requirements
 */
class RequirementAnalyzer {
  public:
    explicit RequirementAnalyzer(LoadDensities densities = {}) : densities_(densities) {}

    /**
     * @brief Emit basement services and per-floor loads
     * @param profile Validated building
     * @param rng Shared random stream, used for floor load locations
     * @param target_total_load Optional total load (kW); when positive the
     *        distributed loads are scaled to sum to it
     * @return Requirements in emission order
     */
    std::vector<ElectricalRequirement> analyze(BuildingProfile const& profile, RandomSource& rng,
                                               Float target_total_load = 0.0) const;

    LoadDensities const& densities() const noexcept { return densities_; }

  private:
    LoadDensities densities_;
};

}  // namespace mepg::planning
