#pragma once

#include <array>

#include "mepg/core/types.h"
#include "mepg/graph/graph.h"

namespace mepg::electrical {

/**
 * @brief Standard distribution equipment ratings (A) and replacement costs (USD)
 */
inline constexpr std::array<Float, 21> STANDARD_DISTRIBUTION_SIZES = {
    60, 100, 150, 200, 225, 300, 400, 500, 600, 800, 1000,
    1200, 1600, 2000, 2500, 3000, 4000, 5000, 6000, 8000, 10000};

inline constexpr std::array<Float, 21> STANDARD_DISTRIBUTION_COSTS = {
    1000, 1500, 2000, 2250, 3000, 4000, 5000, 6000, 8000, 10000, 12000,
    16000, 20000, 25000, 30000, 40000, 50000, 60000, 80000, 100000, 120000};

/**
 * @brief Standard transformer ratings (kVA) and replacement costs (USD)
 */
inline constexpr std::array<Float, 15> STANDARD_TRANSFORMER_SIZES = {
    15, 25, 37.5, 50, 75, 100, 112.5, 150, 167, 200, 225, 250, 300, 400, 500};

inline constexpr std::array<Float, 15> STANDARD_TRANSFORMER_COSTS = {
    1500, 2500, 3750, 5000, 7500, 10000, 11250, 15000, 16700, 20000, 22500, 25000, 30000, 40000,
    50000};

inline constexpr Float STANDARD_SIZE_LOADING = 0.8;  // Equipment is sized at 80 % loading
inline constexpr Float MAXIMUM_PANEL_RATING = 800.0;  // A; larger panelboards rate as switchboards

struct SizeSelection {
    Float size = 0.0;
    Float cost = 0.0;
};

/**
 * @brief Smallest standard rating carrying the current at 80 % loading
 *
 * Falls back to the largest rating when nothing fits.
 */
SizeSelection select_distribution_size(Float current);

/**
 * @brief Smallest standard transformer carrying the demand at 80 % loading
 */
SizeSelection select_transformer_size(Float demand_kva);

/**
 * @brief Line current (A) for a power (kW) at a voltage (V)
 * @return 0 when the voltage is not positive
 */
Float line_current(Float power_kw, Float voltage, int phase_count, Float power_factor);

/**
 * @brief Baseline lifecycle figures for new equipment
 */
struct LifecycleBaseline {
    int expected_lifespan = 0;       // Years
    int maintenance_interval = 0;    // Months
    Float mean_time_to_failure = 0;  // Hours
};

LifecycleBaseline lifecycle_baseline(NodeType type, NodeSubtype subtype);

/**
 * @brief Fill ratings and replacement cost from a node's resolved currents and demand
 *
 * Transformers are sized on apparent power, demand (kW) / power factor.
 */
void apply_standard_sizing(graph::Node& node, Float power_factor);

}  // namespace mepg::electrical
