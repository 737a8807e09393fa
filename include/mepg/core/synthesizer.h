#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

#include "mepg/core/types.h"
#include "mepg/electrical/constraint_validator.h"
#include "mepg/graph/graph.h"

namespace mepg::core {

/**
 * @brief Synthesis configuration
 */
struct SynthesisConfig {
    int construction_year = 2024;  // Installation year of all equipment
    Float target_total_load = 0.0;  // kW; 0 keeps the density based loads
    Float frequency = 60.0;         // Hz
    Float power_factor = 0.9;
    std::string description = "Synthesized building electrical distribution";
};

/**
 * @brief Finished graph with the intermediate facts that produced it
 */
struct SynthesisResult {
    graph::Graph graph;
    CoreStrategy core_strategy;
    size_t requirement_count = 0;
    electrical::ValidationReport validation;
    std::uint64_t seed = 0;
};

/**
 * @brief Construction entry point running the whole pipeline
 *
 * building profile -> core strategy -> requirements -> decisions -> graph ->
 * voltage propagation -> validation (repeated once after structural repairs)
 * -> risk scores. All randomness comes from one stream seeded per call.
 */
class TopologySynthesizer {
  public:
    explicit TopologySynthesizer(SynthesisConfig config = {}) : config_(std::move(config)) {}

    /**
     * @brief Generate an energized distribution graph
     * @param params Building parameters
     * @param node_count Target node count, at least 3
     * @param seed Seed of the random stream; drawn from the system when absent
     * @throws InvalidParameter for node_count < 3 or invalid building parameters
     */
    SynthesisResult generate(BuildingParameters const& params, int node_count,
                             std::optional<std::uint64_t> seed = std::nullopt) const;

    SynthesisConfig const& config() const noexcept { return config_; }

  private:
    SynthesisConfig config_;
};

}  // namespace mepg::core
