#pragma once

#include "mepg/core/types.h"

namespace mepg::planning {

/**
 * @brief Validated, immutable building geometry
 *
 * Floor index 0 is the basement at z = -basement_depth; floor i >= 1 is the
 * i-th floor above grade at z = (i - 1) * floor_height.
 */
class BuildingProfile {
  public:
    static constexpr Float SQFT_PER_M2 = 10.7639;

    /**
     * @brief Validate raw parameters
     * @throws InvalidParameter if a length is not positive, the floor count is
     *         below one or the core center lies outside the footprint
     */
    static BuildingProfile from_parameters(BuildingParameters const& params);

    Float length() const noexcept { return length_; }
    Float width() const noexcept { return width_; }
    Float floor_height() const noexcept { return floor_height_; }
    int floor_count() const noexcept { return floor_count_; }
    Float basement_depth() const noexcept { return basement_depth_; }
    CoreFootprint const& core() const noexcept { return core_; }

    Float footprint_area() const noexcept { return length_ * width_; }
    Float footprint_area_sqft() const noexcept { return footprint_area() * SQFT_PER_M2; }
    Float total_floor_area() const noexcept { return footprint_area() * floor_count_; }
    Float total_floor_area_sqft() const noexcept { return total_floor_area() * SQFT_PER_M2; }
    Float height() const noexcept { return floor_height_ * floor_count_; }
    Float aspect_ratio() const noexcept;

    int basement_floor() const noexcept { return 0; }
    int top_floor() const noexcept { return floor_count_; }

    /**
     * @brief Elevation of a floor level
     * @throws std::out_of_range for floors outside [0, floor_count]
     */
    Float floor_z(int floor) const;

    BuildingParameters to_parameters() const;

  private:
    BuildingProfile() = default;

    Float length_ = 0.0;
    Float width_ = 0.0;
    Float floor_height_ = 0.0;
    int floor_count_ = 0;
    Float basement_depth_ = 0.0;
    CoreFootprint core_;
};

}  // namespace mepg::planning
