#pragma once

#include <map>
#include <ostream>
#include <string>

#include "mepg/electrical/constraint_validator.h"
#include "mepg/graph/graph.h"

namespace mepg::core {

/**
 * @brief Counts and cable statistics reported after generation
 */
struct GraphSummary {
    size_t node_count = 0;
    size_t edge_count = 0;
    std::map<std::string, size_t> type_counts;  // node type -> count
    size_t source_count = 0;
    Float min_cable_distance = 0.0;
    Float max_cable_distance = 0.0;
    Float mean_cable_distance = 0.0;
    Float total_cable_distance = 0.0;
    Float total_demand = 0.0;  // kW
};

GraphSummary summarize(graph::Graph const& graph);

/**
 * @brief Human-readable report of a summary and the validation outcome
 */
void print_summary(std::ostream& out, GraphSummary const& summary,
                   electrical::ValidationReport const& validation);

}  // namespace mepg::core
