#include "mepg/planning/node_decision_planner.h"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <map>
#include <set>
#include <sstream>
#include <string>
#include <utility>

#include "mepg/core/errors.h"
#include "mepg/logging/logger.h"
#include "mepg/planning/core_strategy_planner.h"

namespace mepg::planning {

namespace {

/**
 * @brief Hands out equipment positions at the cores, one slot per piece of
 *        equipment so that co-located equipment does not overlap
 */
class CorePlacer {
  public:
    CorePlacer(BuildingProfile const& profile, CoreStrategy const& strategy, Float spacing)
        : profile_(profile), strategy_(strategy), spacing_(spacing) {}

    Point3 place(int floor, Float near_x, Float near_y) {
        auto const& core = nearest_core(strategy_, near_x, near_y);
        int const slot = slots_[{floor, core.core_id}]++;
        Point3 p;
        p.x = std::clamp(core.x_center + slot * spacing_, 0.0, profile_.length());
        p.y = core.y_center;
        p.z = profile_.floor_z(floor);
        return p;
    }

  private:
    BuildingProfile const& profile_;
    CoreStrategy const& strategy_;
    Float spacing_;
    std::map<std::pair<int, int>, int> slots_;
};

std::pair<Float, Float> centroid(std::vector<ElectricalRequirement> const& requirements,
                                 std::vector<int> const& indices) {
    Float x = 0.0;
    Float y = 0.0;
    for (int i : indices) {
        x += requirements[i].location.x;
        y += requirements[i].location.y;
    }
    Float const n = indices.empty() ? 1.0 : static_cast<Float>(indices.size());
    return {x / n, y / n};
}

std::string format_kw(Float kw) {
    std::ostringstream oss;
    oss.precision(1);
    oss << std::fixed << kw << " kW";
    return oss.str();
}

}  // namespace

Float NodeDecisionPlanner::estimated_total_load(
    std::vector<ElectricalRequirement> const& requirements) {
    Float total = 0.0;
    for (auto const& req : requirements) {
        if (req.load_type != LoadType::MAIN_SERVICE) total += req.load_kw;
    }
    return total;
}

std::vector<NodeDecision> NodeDecisionPlanner::plan(
    std::vector<ElectricalRequirement> const& requirements, BuildingProfile const& profile,
    CoreStrategy const& strategy, int target_node_count, RandomSource& rng) const {
    if (target_node_count < 3) {
        throw InvalidParameter("Target node count must be at least 3, got " +
                               std::to_string(target_node_count));
    }

    auto& logger = logging::global_logger;
    logging::ComponentScope scope(logger, "NodeDecisionPlanner");

    std::vector<NodeDecision> decisions;
    CorePlacer placer(profile, strategy, config_.equipment_spacing);
    Float const total_load = estimated_total_load(requirements);

    // Main service entrance
    auto main_it = std::find_if(requirements.begin(), requirements.end(), [](auto const& req) {
        return req.load_type == LoadType::MAIN_SERVICE;
    });
    if (main_it != requirements.end() && total_load > config_.main_service_threshold) {
        int const main_index = static_cast<int>(std::distance(requirements.begin(), main_it));

        NodeDecision transformer;
        transformer.type = NodeType::TRANSFORMER;
        transformer.subtype = NodeSubtype::MAIN;
        transformer.reason = "Utility service for " + format_kw(total_load) + " building load";
        transformer.capacity_kw = total_load * config_.main_transformer_factor;
        transformer.floor = main_it->floor;
        transformer.location = main_it->location;
        transformer.served = {main_index};
        transformer.room = main_it->room;
        transformer.priority = 1;
        decisions.push_back(transformer);

        NodeDecision switchboard = transformer;
        switchboard.type = NodeType::SWITCHBOARD;
        switchboard.reason = "Main distribution for " + format_kw(total_load) + " building load";
        switchboard.capacity_kw = total_load * config_.main_switchboard_factor;
        decisions.push_back(switchboard);
    } else {
        LOG_INFO(logger, "No main service: estimated load", total_load, "kW");
    }

    // Per floor distribution, grouped by floor and voltage class
    std::map<std::pair<int, VoltageClass>, std::vector<int>> groups;
    for (size_t i = 0; i < requirements.size(); ++i) {
        auto const& req = requirements[i];
        if (req.load_type == LoadType::MAIN_SERVICE || req.voltage_class == VoltageClass::HIGH) {
            continue;
        }
        groups[{req.floor, req.voltage_class}].push_back(static_cast<int>(i));
    }

    for (auto const& [key, indices] : groups) {
        auto const [floor, voltage_class] = key;
        Float group_load = 0.0;
        for (int i : indices) group_load += requirements[i].load_kw;
        auto const [cx, cy] = centroid(requirements, indices);
        std::string const room = floor == 0 ? "ELEC-B1" : "L" + std::to_string(floor) + "-ELEC";

        if (voltage_class == VoltageClass::MEDIUM) {
            if (group_load > config_.secondary_threshold) {
                NodeDecision transformer;
                transformer.type = NodeType::TRANSFORMER;
                transformer.subtype = NodeSubtype::SECONDARY;
                transformer.reason = "Step-down for " + format_kw(group_load) +
                                     " medium voltage load on floor " + std::to_string(floor);
                transformer.capacity_kw = group_load * config_.secondary_transformer_factor;
                transformer.floor = floor;
                transformer.location = placer.place(floor, cx, cy);
                transformer.served = indices;
                transformer.room = room;
                decisions.push_back(transformer);
            }

            NodeDecision panel;
            panel.type = NodeType::PANELBOARD;
            panel.subtype = NodeSubtype::DISTRIBUTION;
            panel.reason = "Medium voltage distribution on floor " + std::to_string(floor);
            panel.capacity_kw = group_load * config_.distribution_panel_factor;
            panel.floor = floor;
            panel.location = placer.place(floor, cx, cy);
            panel.served = indices;
            panel.room = room;
            decisions.push_back(panel);
            continue;
        }

        // Panels beyond the requirement count get an empty share and stay as spares
        int const panel_count =
            std::clamp(static_cast<int>(std::floor(group_load / config_.low_panel_share)), 1,
                       config_.max_low_panels);

        std::vector<std::vector<int>> shares(static_cast<size_t>(panel_count));
        for (size_t j = 0; j < indices.size(); ++j) {
            shares[j % shares.size()].push_back(indices[j]);
        }

        for (auto const& share : shares) {
            Float share_load = 0.0;
            bool serves_lighting = false;
            for (int i : share) {
                share_load += requirements[i].load_kw;
                serves_lighting |= requirements[i].load_type == LoadType::LIGHTING;
            }
            auto const [sx, sy] =
                share.empty() ? std::make_pair(cx, cy) : centroid(requirements, share);

            NodeDecision panel;
            panel.type = NodeType::PANELBOARD;
            panel.subtype = serves_lighting ? NodeSubtype::LIGHTING : NodeSubtype::POWER;
            panel.reason = "Low voltage " + node_subtype_to_string(panel.subtype) +
                           " panel on floor " + std::to_string(floor);
            panel.capacity_kw = share_load * config_.low_panel_factor;
            panel.floor = floor;
            panel.location = placer.place(floor, sx, sy);
            panel.served = share;
            panel.room = room;
            decisions.push_back(panel);
        }
    }

    // One load per requirement
    for (size_t i = 0; i < requirements.size(); ++i) {
        auto const& req = requirements[i];
        if (req.load_type == LoadType::MAIN_SERVICE) continue;

        NodeDecision load;
        load.type = NodeType::LOAD;
        load.subtype = NodeSubtype::END_LOAD;
        load.reason = load_type_label(req.load_type) + " load on floor " + std::to_string(req.floor);
        load.capacity_kw = req.load_kw;
        load.floor = req.floor;
        load.location = req.location;
        load.served = {static_cast<int>(i)};
        load.load_type = req.load_type;
        load.room = req.room;
        load.priority = req.priority;
        decisions.push_back(load);
    }

    for (size_t k = 0; k < decisions.size(); ++k) {
        decisions[k].id = static_cast<int>(k) + 1;
    }

    size_t const target = static_cast<size_t>(target_node_count);
    size_t const planned = decisions.size();

    if (decisions.size() < target) {
        while (decisions.size() < target) {
            NodeDecision panel;
            panel.id = static_cast<int>(decisions.size()) + 1;
            panel.type = NodeType::PANELBOARD;
            panel.subtype = NodeSubtype::GENERIC;
            panel.floor = rng.uniform_int(1, profile.floor_count());
            panel.capacity_kw = rng.uniform(config_.filler_min_capacity, config_.filler_max_capacity);
            panel.location.x = rng.uniform(0.0, profile.length());
            panel.location.y = rng.uniform(0.0, profile.width());
            panel.location.z = profile.floor_z(panel.floor);
            panel.reason = "Additional distribution capacity on floor " + std::to_string(panel.floor);
            panel.room = "L" + std::to_string(panel.floor) + "-ELEC";
            decisions.push_back(panel);
        }
        LOG_INFO(logger, "Padded", target - planned, "generic panelboards to reach", target,
                 "nodes");
    } else if (decisions.size() > target) {
        std::vector<NodeDecision const*> loads;
        size_t non_load_count = 0;
        for (auto const& decision : decisions) {
            if (decision.type == NodeType::LOAD) {
                loads.push_back(&decision);
            } else {
                ++non_load_count;
            }
        }

        size_t const load_slots = target > non_load_count ? target - non_load_count : 0;
        std::stable_sort(loads.begin(), loads.end(), [](auto const* a, auto const* b) {
            if (a->capacity_kw != b->capacity_kw) return a->capacity_kw > b->capacity_kw;
            return a->id < b->id;
        });

        std::set<int> kept;
        for (size_t k = 0; k < std::min(load_slots, loads.size()); ++k) {
            kept.insert(loads[k]->id);
        }

        std::vector<NodeDecision> reconciled;
        for (auto const& decision : decisions) {
            if (decision.type != NodeType::LOAD || kept.count(decision.id) > 0) {
                reconciled.push_back(decision);
            }
        }
        decisions = std::move(reconciled);

        if (non_load_count > target) {
            LOG_WARN(logger, "Equipment alone needs", non_load_count, "nodes, above the target of",
                     target);
        }
        LOG_INFO(logger, "Trimmed", planned - decisions.size(), "loads to approach", target,
                 "nodes");
    }

    LOG_INFO(logger, "Planned", decisions.size(), "decisions from", requirements.size(),
             "requirements, estimated load", total_load, "kW");
    return decisions;
}

}  // namespace mepg::planning
