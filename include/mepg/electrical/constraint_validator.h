#pragma once

#include <string>
#include <vector>

#include "mepg/electrical/voltage_propagator.h"
#include "mepg/graph/graph.h"

namespace mepg::electrical {

enum class Severity {
    WARNING = 0,   // Reported, graph left as is
    REPAIRED = 1   // Fixed in place
};

std::string severity_to_string(Severity severity);

/**
 * @brief One finding of the validator with before/after values
 */
struct ValidationRecord {
    std::string rule;
    Severity severity = Severity::WARNING;
    std::string node_id;
    std::string before;
    std::string after;
    std::string message;
};

struct ValidationReport {
    std::vector<ValidationRecord> records;
    bool structure_changed = false;  // Edges were added or removed

    size_t warning_count() const noexcept;
    size_t repair_count() const noexcept;
    bool clean() const noexcept { return records.empty(); }

    void append(ValidationReport const& other);
};

/**
 * @brief Checks and repairs the hierarchy invariants of an energized graph
 *
 * Pass 1 enforces the transformer step-down and reports transformer to
 * transformer connections without changing them. Pass 2 leaves every load with
 * exactly one feed, coming from its nearest panelboard. A second run over a
 * repaired graph changes nothing.
 */
class ConstraintValidator {
  public:
    explicit ConstraintValidator(VoltagePropagator const& propagator) : propagator_(propagator) {}

    ValidationReport validate(graph::Graph& graph) const;

    static constexpr char const* RULE_STEP_DOWN = "transformer_step_down";
    static constexpr char const* RULE_TRANSFORMER_ADJACENCY = "transformer_adjacency";
    static constexpr char const* RULE_LOAD_FEED = "load_single_feed";

  private:
    void check_step_down(graph::Graph& graph, ValidationReport& report) const;
    void check_transformer_adjacency(graph::Graph const& graph, ValidationReport& report) const;
    void check_load_feeds(graph::Graph& graph, ValidationReport& report) const;
    void attach_to_panelboard(graph::Graph& graph, graph::Node const& load,
                              std::string const& panel) const;

    VoltagePropagator const& propagator_;
};

}  // namespace mepg::electrical
