#include "mepg/planning/requirement_analyzer.h"

#include <algorithm>
#include <string>

#include "mepg/logging/logger.h"

namespace mepg::planning {

namespace {

Point3 random_floor_location(BuildingProfile const& profile, int floor, RandomSource& rng) {
    Point3 p;
    p.x = rng.uniform(0.0, profile.length());
    p.y = rng.uniform(0.0, profile.width());
    p.z = profile.floor_z(floor);
    return p;
}

std::string floor_room(int floor, char const* suffix) {
    return "L" + std::to_string(floor) + "-" + suffix;
}

}  // namespace

std::vector<ElectricalRequirement> RequirementAnalyzer::analyze(BuildingProfile const& profile,
                                                                RandomSource& rng,
                                                                Float target_total_load) const {
    auto& logger = logging::global_logger;
    logging::ComponentScope scope(logger, "RequirementAnalyzer");

    std::vector<ElectricalRequirement> requirements;
    Float const footprint_sqft = profile.footprint_area_sqft();
    CoreFootprint const& core = profile.core();
    Float const basement_z = profile.floor_z(profile.basement_floor());

    // Basement services sit in the electrical room at the core
    ElectricalRequirement main_service;
    main_service.load_kw = densities_.main_service * footprint_sqft * profile.floor_count() / 1000.0;
    main_service.voltage_class = VoltageClass::HIGH;
    main_service.location = {core.x_center, core.y_center, basement_z};
    main_service.load_type = LoadType::MAIN_SERVICE;
    main_service.floor = profile.basement_floor();
    main_service.room = "ELEC-B1";
    main_service.priority = 1;
    requirements.push_back(main_service);

    ElectricalRequirement hvac;
    hvac.load_kw = densities_.hvac * profile.total_floor_area_sqft() / 1000.0;
    hvac.voltage_class = VoltageClass::MEDIUM;
    hvac.location = {std::min(core.x_center + core.size / 2.0, profile.length()), core.y_center,
                     basement_z};
    hvac.load_type = LoadType::HVAC;
    hvac.floor = profile.basement_floor();
    hvac.room = "MECH-B1";
    hvac.priority = 2;
    requirements.push_back(hvac);

    for (int floor = 1; floor <= profile.floor_count(); ++floor) {
        ElectricalRequirement lighting;
        lighting.load_kw = densities_.lighting * footprint_sqft / 1000.0;
        lighting.voltage_class = VoltageClass::LOW;
        lighting.location = random_floor_location(profile, floor, rng);
        lighting.load_type = LoadType::LIGHTING;
        lighting.floor = floor;
        lighting.room = floor_room(floor, "OPEN");
        lighting.priority = 2;
        requirements.push_back(lighting);

        ElectricalRequirement power;
        power.load_kw = densities_.general_power * footprint_sqft / 1000.0;
        power.voltage_class = VoltageClass::LOW;
        power.location = random_floor_location(profile, floor, rng);
        power.load_type = LoadType::GENERAL_POWER;
        power.floor = floor;
        power.room = floor_room(floor, "OPEN");
        power.priority = 3;
        requirements.push_back(power);

        if (densities_.kitchen_interval > 0 && floor % densities_.kitchen_interval == 0) {
            ElectricalRequirement kitchen;
            kitchen.load_kw = densities_.kitchen;
            kitchen.voltage_class = VoltageClass::MEDIUM;
            kitchen.location = random_floor_location(profile, floor, rng);
            kitchen.load_type = LoadType::KITCHEN;
            kitchen.floor = floor;
            kitchen.room = floor_room(floor, "KITCHEN");
            kitchen.priority = 3;
            requirements.push_back(kitchen);
        }

        if (floor == profile.top_floor()) {
            ElectricalRequirement data_center;
            data_center.load_kw = densities_.data_center;
            data_center.voltage_class = VoltageClass::MEDIUM;
            data_center.location = random_floor_location(profile, floor, rng);
            data_center.load_type = LoadType::DATA_CENTER;
            data_center.floor = floor;
            data_center.room = floor_room(floor, "DATA");
            data_center.priority = 1;
            requirements.push_back(data_center);
        }
    }

    if (target_total_load > 0.0) {
        Float distributed = 0.0;
        for (auto const& req : requirements) {
            if (req.load_type != LoadType::MAIN_SERVICE) distributed += req.load_kw;
        }
        Float const scale = distributed > 0.0 ? target_total_load / distributed : 1.0;
        for (auto& req : requirements) {
            if (req.load_type == LoadType::MAIN_SERVICE) {
                req.load_kw = target_total_load;
            } else {
                req.load_kw *= scale;
            }
        }
        LOG_DEBUG(logger, "Scaled distributed loads by", scale, "to reach", target_total_load,
                  "kW");
    }

    LOG_INFO(logger, "Derived", requirements.size(), "electrical requirements for",
             profile.floor_count(), "floors");
    return requirements;
}

}  // namespace mepg::planning
