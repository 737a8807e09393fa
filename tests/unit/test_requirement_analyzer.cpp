#include "mepg/core/random_source.h"
#include "mepg/planning/building_profile.h"
#include "mepg/planning/requirement_analyzer.h"

#include "test_framework.h"

using namespace mepg;
using namespace mepg::planning;

namespace {

BuildingProfile make_profile(Float length, Float width, int floors) {
    BuildingParameters params;
    params.length = length;
    params.width = width;
    params.floor_count = floors;
    return BuildingProfile::from_parameters(params);
}

}  // namespace

void test_requirements_minimal_building() {
    auto profile = make_profile(20.0, 20.0, 3);
    RandomSource rng(1);
    auto requirements = RequirementAnalyzer().analyze(profile, rng);

    // main + hvac + (lighting + power) x 3 + kitchen on floor 3 + data center
    ASSERT_EQ(10, requirements.size());

    ASSERT_EQ(LoadType::MAIN_SERVICE, requirements[0].load_type);
    ASSERT_EQ(VoltageClass::HIGH, requirements[0].voltage_class);
    ASSERT_NEAR(64.5834, requirements[0].load_kw, 1e-6);
    ASSERT_EQ(0, requirements[0].floor);
    ASSERT_EQ("ELEC-B1", requirements[0].room);
    ASSERT_EQ(1, requirements[0].priority);

    ASSERT_EQ(LoadType::HVAC, requirements[1].load_type);
    ASSERT_EQ(VoltageClass::MEDIUM, requirements[1].voltage_class);
    ASSERT_NEAR(32.2917, requirements[1].load_kw, 1e-6);
    ASSERT_EQ("MECH-B1", requirements[1].room);

    ASSERT_EQ(LoadType::LIGHTING, requirements[2].load_type);
    ASSERT_EQ(VoltageClass::LOW, requirements[2].voltage_class);
    ASSERT_NEAR(6.45834, requirements[2].load_kw, 1e-6);
    ASSERT_EQ(1, requirements[2].floor);
    ASSERT_EQ("L1-OPEN", requirements[2].room);

    ASSERT_EQ(LoadType::GENERAL_POWER, requirements[3].load_type);
    ASSERT_NEAR(12.91668, requirements[3].load_kw, 1e-6);

    ASSERT_EQ(LoadType::KITCHEN, requirements[8].load_type);
    ASSERT_EQ(3, requirements[8].floor);
    ASSERT_NEAR(25.0, requirements[8].load_kw, 1e-12);
    ASSERT_EQ("L3-KITCHEN", requirements[8].room);

    ASSERT_EQ(LoadType::DATA_CENTER, requirements[9].load_type);
    ASSERT_EQ(3, requirements[9].floor);
    ASSERT_NEAR(50.0, requirements[9].load_kw, 1e-12);
    ASSERT_EQ(1, requirements[9].priority);
}

void test_requirement_locations() {
    auto profile = make_profile(20.0, 20.0, 3);
    RandomSource rng(3);
    auto requirements = RequirementAnalyzer().analyze(profile, rng);

    // Services at the core in the basement, HVAC half a core to the side
    ASSERT_NEAR(10.0, requirements[0].location.x, 1e-12);
    ASSERT_NEAR(10.0, requirements[0].location.y, 1e-12);
    ASSERT_NEAR(-4.0, requirements[0].location.z, 1e-12);
    ASSERT_NEAR(13.0, requirements[1].location.x, 1e-12);
    ASSERT_NEAR(-4.0, requirements[1].location.z, 1e-12);

    for (auto const& req : requirements) {
        ASSERT_TRUE(req.location.x >= 0.0 && req.location.x <= 20.0);
        ASSERT_TRUE(req.location.y >= 0.0 && req.location.y <= 20.0);
        ASSERT_NEAR(profile.floor_z(req.floor), req.location.z, 1e-12);
    }
}

void test_kitchens_every_third_floor() {
    auto profile = make_profile(30.0, 30.0, 7);
    RandomSource rng(5);
    auto requirements = RequirementAnalyzer().analyze(profile, rng);

    std::vector<int> kitchen_floors;
    int data_centers = 0;
    for (auto const& req : requirements) {
        if (req.load_type == LoadType::KITCHEN) kitchen_floors.push_back(req.floor);
        if (req.load_type == LoadType::DATA_CENTER) {
            ++data_centers;
            ASSERT_EQ(7, req.floor);
        }
    }
    ASSERT_EQ(2, kitchen_floors.size());
    ASSERT_EQ(3, kitchen_floors[0]);
    ASSERT_EQ(6, kitchen_floors[1]);
    ASSERT_EQ(1, data_centers);
    ASSERT_EQ(2 + 7 * 2 + 2 + 1, requirements.size());
}

void test_requirements_scaled_to_target_load() {
    auto profile = make_profile(20.0, 20.0, 3);
    RandomSource rng(1);
    auto requirements = RequirementAnalyzer().analyze(profile, rng, 500.0);

    Float distributed = 0.0;
    for (auto const& req : requirements) {
        if (req.load_type == LoadType::MAIN_SERVICE) {
            ASSERT_NEAR(500.0, req.load_kw, 1e-9);
        } else {
            distributed += req.load_kw;
        }
    }
    ASSERT_NEAR(500.0, distributed, 1e-9);
}

void test_requirements_reproducible_with_seed() {
    auto profile = make_profile(40.0, 25.0, 4);
    RandomSource first_rng(11);
    RandomSource second_rng(11);
    auto first = RequirementAnalyzer().analyze(profile, first_rng);
    auto second = RequirementAnalyzer().analyze(profile, second_rng);

    ASSERT_EQ(first.size(), second.size());
    for (size_t i = 0; i < first.size(); ++i) {
        ASSERT_NEAR(first[i].location.x, second[i].location.x, 0.0);
        ASSERT_NEAR(first[i].location.y, second[i].location.y, 0.0);
        ASSERT_NEAR(first[i].load_kw, second[i].load_kw, 0.0);
    }
}

void register_requirement_analyzer_tests(TestRunner& runner) {
    runner.add_test("Requirements Minimal Building", test_requirements_minimal_building);
    runner.add_test("Requirement Locations", test_requirement_locations);
    runner.add_test("Kitchens Every Third Floor", test_kitchens_every_third_floor);
    runner.add_test("Requirements Scaled To Target Load", test_requirements_scaled_to_target_load);
    runner.add_test("Requirements Reproducible With Seed", test_requirements_reproducible_with_seed);
}
