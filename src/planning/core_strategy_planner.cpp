#include "mepg/planning/core_strategy_planner.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include "mepg/logging/logger.h"

namespace mepg::planning {

CoreStrategy CoreStrategyPlanner::plan(BuildingProfile const& profile) const {
    auto& logger = logging::global_logger;
    logging::ComponentScope scope(logger, "CoreStrategyPlanner");

    Float const aspect = profile.aspect_ratio();
    Float const height = profile.height();
    Float const area = profile.footprint_area();

    CoreStrategy strategy;
    if (height > config_.single_core_height ||
        (aspect < config_.compact_aspect_ratio && profile.floor_count() > config_.compact_min_floors)) {
        strategy.kind = CoreStrategyKind::SINGLE_CORE;
        strategy.num_cores = 1;
    } else if (height >= config_.dual_core_min_height && height <= config_.single_core_height &&
               aspect <= config_.dual_core_max_aspect_ratio) {
        strategy.kind = CoreStrategyKind::DUAL_CORE;
        strategy.num_cores = 2;
    } else {
        strategy.kind = CoreStrategyKind::MULTI_CORE;
        int const needed = static_cast<int>(std::ceil(area / config_.area_per_core));
        strategy.num_cores = std::clamp(needed, config_.min_multi_cores, config_.max_multi_cores);
    }

    strategy.positions = place_cores(profile, strategy.num_cores);

    LOG_INFO(logger, "Core strategy", core_strategy_to_string(strategy.kind), "with",
             strategy.num_cores, "cores (height", height, "m, aspect", aspect, ")");
    return strategy;
}

std::vector<CorePosition> CoreStrategyPlanner::place_cores(BuildingProfile const& profile,
                                                           int num_cores) {
    Float const L = profile.length();
    Float const W = profile.width();
    std::vector<CorePosition> positions;

    switch (num_cores) {
        case 1:
            positions.push_back({L * 0.5, W * 0.5, 1});
            break;
        case 2:
            // Split along the longer axis
            if (L >= W) {
                positions.push_back({L * 0.3, W * 0.5, 1});
                positions.push_back({L * 0.7, W * 0.5, 2});
            } else {
                positions.push_back({L * 0.5, W * 0.3, 1});
                positions.push_back({L * 0.5, W * 0.7, 2});
            }
            break;
        case 3:
            positions.push_back({L * 0.25, W * 0.25, 1});
            positions.push_back({L * 0.75, W * 0.25, 2});
            positions.push_back({L * 0.5, W * 0.75, 3});
            break;
        case 4:
            positions.push_back({L * 0.25, W * 0.25, 1});
            positions.push_back({L * 0.75, W * 0.25, 2});
            positions.push_back({L * 0.25, W * 0.75, 3});
            positions.push_back({L * 0.75, W * 0.75, 4});
            break;
        default:
            throw std::invalid_argument("Unsupported core count: " + std::to_string(num_cores));
    }
    return positions;
}

CorePosition const& nearest_core(CoreStrategy const& strategy, Float x, Float y) {
    if (strategy.positions.empty()) {
        throw std::invalid_argument("Core strategy has no core positions");
    }

    auto const* best = &strategy.positions.front();
    Float best_distance = std::hypot(best->x_center - x, best->y_center - y);
    for (auto const& core : strategy.positions) {
        Float const d = std::hypot(core.x_center - x, core.y_center - y);
        if (d < best_distance) {
            best = &core;
            best_distance = d;
        }
    }
    return *best;
}

}  // namespace mepg::planning
