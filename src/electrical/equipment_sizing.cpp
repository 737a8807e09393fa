#include "mepg/electrical/equipment_sizing.h"

#include <cmath>
#include <type_traits>
#include <variant>

namespace mepg::electrical {

namespace {

template <size_t N>
SizeSelection select_size(std::array<Float, N> const& sizes, std::array<Float, N> const& costs,
                          Float value) {
    for (size_t i = 0; i < N; ++i) {
        if (value <= sizes[i] * STANDARD_SIZE_LOADING) {
            return {sizes[i], costs[i]};
        }
    }
    return {sizes[N - 1], costs[N - 1]};
}

}  // namespace

SizeSelection select_distribution_size(Float current) {
    return select_size(STANDARD_DISTRIBUTION_SIZES, STANDARD_DISTRIBUTION_COSTS, current);
}

SizeSelection select_transformer_size(Float demand_kva) {
    return select_size(STANDARD_TRANSFORMER_SIZES, STANDARD_TRANSFORMER_COSTS, demand_kva);
}

Float line_current(Float power_kw, Float voltage, int phase_count, Float power_factor) {
    if (voltage <= 0.0 || power_factor <= 0.0) return 0.0;
    Float const power_w = power_kw * 1000.0;
    if (phase_count == 3) {
        return power_w / (std::sqrt(3.0) * voltage * power_factor);
    }
    return power_w / (voltage * power_factor);
}

LifecycleBaseline lifecycle_baseline(NodeType type, NodeSubtype subtype) {
    switch (type) {
        case NodeType::TRANSFORMER:
            if (subtype == NodeSubtype::MAIN) return {35, 12, 306600.0};
            return {30, 12, 262800.0};
        case NodeType::SWITCHBOARD:
            return {30, 24, 262800.0};
        case NodeType::PANELBOARD:
            return {25, 24, 219000.0};
        case NodeType::LOAD:
        default:
            return {15, 6, 131400.0};
    }
}

void apply_standard_sizing(graph::Node& node, Float power_factor) {
    Float const demand_kva = power_factor > 0.0 ? node.demand / power_factor : node.demand;
    std::visit(
        [&node, demand_kva](auto& attrs) {
            using T = std::decay_t<decltype(attrs)>;
            if constexpr (std::is_same_v<T, graph::TransformerAttributes>) {
                auto const rating = select_transformer_size(demand_kva);
                attrs.nominal_power = rating.size;
                attrs.upstream_current_rating = select_distribution_size(attrs.upstream_current).size;
                attrs.downstream_current_rating =
                    select_distribution_size(attrs.downstream_current).size;
                node.replacement_cost = rating.cost;
            } else if constexpr (std::is_same_v<T, graph::SwitchboardAttributes>) {
                auto const rating = select_distribution_size(attrs.current);
                attrs.bus_rating = rating.size;
                node.replacement_cost = rating.cost;
            } else if constexpr (std::is_same_v<T, graph::PanelboardAttributes>) {
                auto const rating = select_distribution_size(attrs.current);
                attrs.current_rating = rating.size;
                attrs.rated_as_switchboard = rating.size > MAXIMUM_PANEL_RATING;
                node.replacement_cost = rating.cost;
            } else {
                node.replacement_cost = 0.0;
            }
        },
        node.attributes);
}

}  // namespace mepg::electrical
