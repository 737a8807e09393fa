#include "mepg/planning/building_profile.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

#include "mepg/core/errors.h"
#include "mepg/logging/logger.h"

namespace mepg::planning {

namespace {

void require_positive(Float value, char const* name) {
    if (!std::isfinite(value) || value <= 0.0) {
        throw InvalidParameter(std::string(name) + " must be positive, got " +
                               std::to_string(value));
    }
}

}  // namespace

BuildingProfile BuildingProfile::from_parameters(BuildingParameters const& params) {
    require_positive(params.length, "Building length");
    require_positive(params.width, "Building width");
    require_positive(params.floor_height, "Floor height");
    require_positive(params.basement_depth, "Basement depth");
    if (params.floor_count < 1) {
        throw InvalidParameter("Floor count must be at least 1, got " +
                               std::to_string(params.floor_count));
    }

    BuildingProfile profile;
    profile.length_ = params.length;
    profile.width_ = params.width;
    profile.floor_height_ = params.floor_height;
    profile.floor_count_ = params.floor_count;
    profile.basement_depth_ = params.basement_depth;

    if (params.core) {
        require_positive(params.core->size, "Core size");
        if (params.core->x_center < 0.0 || params.core->x_center > params.length ||
            params.core->y_center < 0.0 || params.core->y_center > params.width) {
            throw InvalidParameter("Core center must lie inside the building footprint");
        }
        profile.core_ = *params.core;
    } else {
        profile.core_ = CoreFootprint{params.length / 2.0, params.width / 2.0, 6.0};
    }

    auto& logger = logging::global_logger;
    LOG_DEBUG(logger, "Building profile:", profile.length_, "x", profile.width_, "m,",
              profile.floor_count_, "floors of", profile.floor_height_, "m");

    return profile;
}

Float BuildingProfile::aspect_ratio() const noexcept {
    return std::max(length_, width_) / std::min(length_, width_);
}

Float BuildingProfile::floor_z(int floor) const {
    if (floor < 0 || floor > floor_count_) {
        throw std::out_of_range("Floor index out of range: " + std::to_string(floor));
    }
    if (floor == 0) return -basement_depth_;
    return (floor - 1) * floor_height_;
}

BuildingParameters BuildingProfile::to_parameters() const {
    BuildingParameters params;
    params.length = length_;
    params.width = width_;
    params.floor_height = floor_height_;
    params.floor_count = floor_count_;
    params.basement_depth = basement_depth_;
    params.core = core_;
    return params;
}

}  // namespace mepg::planning
