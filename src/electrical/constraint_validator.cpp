#include "mepg/electrical/constraint_validator.h"

#include <algorithm>
#include <sstream>
#include <variant>

#include "mepg/graph/graph_builder.h"
#include "mepg/logging/logger.h"

namespace mepg::electrical {

using graph::Graph;
using graph::Node;

namespace {

std::string volts(Float value) {
    std::ostringstream oss;
    oss << value << " V";
    return oss.str();
}

std::string join(std::vector<std::string> const& ids) {
    std::string result;
    for (auto const& id : ids) {
        if (!result.empty()) result += ",";
        result += id;
    }
    return result.empty() ? "none" : result;
}

}  // namespace

std::string severity_to_string(Severity severity) {
    switch (severity) {
        case Severity::WARNING:
            return "warning";
        case Severity::REPAIRED:
            return "repaired";
        default:
            return "unknown";
    }
}

size_t ValidationReport::warning_count() const noexcept {
    return static_cast<size_t>(std::count_if(records.begin(), records.end(), [](auto const& r) {
        return r.severity == Severity::WARNING;
    }));
}

size_t ValidationReport::repair_count() const noexcept {
    return static_cast<size_t>(std::count_if(records.begin(), records.end(), [](auto const& r) {
        return r.severity == Severity::REPAIRED;
    }));
}

void ValidationReport::append(ValidationReport const& other) {
    records.insert(records.end(), other.records.begin(), other.records.end());
    structure_changed = structure_changed || other.structure_changed;
}

ValidationReport ConstraintValidator::validate(Graph& graph) const {
    auto& logger = logging::global_logger;
    logging::ComponentScope scope(logger, "ConstraintValidator");

    ValidationReport report;
    check_step_down(graph, report);
    check_transformer_adjacency(graph, report);
    check_load_feeds(graph, report);

    LOG_INFO(logger, "Validation finished:", report.repair_count(), "repairs,",
             report.warning_count(), "warnings");
    return report;
}

void ConstraintValidator::check_step_down(Graph& graph, ValidationReport& report) const {
    auto& logger = logging::global_logger;

    for (auto& node : graph.nodes()) {
        if (node.type != NodeType::TRANSFORMER || node.state != graph::NodeState::ENERGIZED) {
            continue;
        }
        auto& attrs = std::get<graph::TransformerAttributes>(node.attributes);
        if (attrs.downstream_voltage < attrs.upstream_voltage) continue;

        Float const before = attrs.downstream_voltage;
        Float const repaired = propagator_.voltages().step_down(attrs.upstream_voltage);

        if (repaired >= attrs.upstream_voltage) {
            report.records.push_back({RULE_STEP_DOWN, Severity::WARNING, node.id, volts(before),
                                      volts(before),
                                      "No standard tier below upstream " +
                                          volts(attrs.upstream_voltage)});
            LOG_WARN(logger, "Cannot step down", node.id, "from", attrs.upstream_voltage, "V");
            continue;
        }

        attrs.downstream_voltage = repaired;
        propagator_.update_currents(node);
        size_t const refreshed = propagator_.refresh_downstream(graph, node.id);

        report.records.push_back({RULE_STEP_DOWN, Severity::REPAIRED, node.id, volts(before),
                                  volts(repaired), "Downstream voltage did not step down"});
        LOG_INFO(logger, "Repaired step-down on", node.id, ":", before, "V ->", repaired, "V,",
                 refreshed, "downstream nodes refreshed");
    }
}

void ConstraintValidator::check_transformer_adjacency(Graph const& graph,
                                                      ValidationReport& report) const {
    auto& logger = logging::global_logger;

    for (auto const& edge : graph.edges()) {
        auto const& source = graph.node(edge.source);
        auto const& target = graph.node(edge.target);
        if (source.type != NodeType::TRANSFORMER || target.type != NodeType::TRANSFORMER) continue;

        report.records.push_back({RULE_TRANSFORMER_ADJACENCY, Severity::WARNING, target.id,
                                  source.id, target.id,
                                  "Transformer " + target.id + " is fed by transformer " +
                                      source.id});
        LOG_WARN(logger, "Transformer", source.id, "feeds transformer", target.id);
    }
}

void ConstraintValidator::attach_to_panelboard(Graph& graph, Node const& load,
                                               std::string const& panel) const {
    auto const label =
        load_type_label(std::get<graph::LoadAttributes>(load.attributes).load_type);
    graph::GraphBuilder::connect(graph, panel, load.id, label);
    if (auto* edge = graph.find_edge(panel, load.id)) {
        propagator_.energize_edge(graph, *edge);
    }
}

void ConstraintValidator::check_load_feeds(Graph& graph, ValidationReport& report) const {
    auto& logger = logging::global_logger;

    std::vector<std::string> load_ids;
    for (auto const& node : graph.nodes()) {
        if (node.type == NodeType::LOAD) load_ids.push_back(node.id);
    }

    for (auto const& load_id : load_ids) {
        Node const& load = graph.node(load_id);
        auto const feeds = graph.predecessors(load_id);

        bool const valid =
            feeds.size() == 1 && graph.node(feeds.front()).type == NodeType::PANELBOARD;
        if (valid) continue;

        auto const nearest = graph::nearest_panelboard(graph, load.location);
        if (!nearest) {
            report.records.push_back({RULE_LOAD_FEED, Severity::WARNING, load_id, join(feeds),
                                      join(feeds), "No panelboard available"});
            LOG_WARN(logger, "No panelboard available for", load_id);
            continue;
        }

        std::string keep;
        std::string message;
        if (feeds.empty()) {
            keep = *nearest;
            message = "Orphaned load connected to nearest panelboard";
        } else {
            // Nearest panelboard among the existing feeds, first one on ties
            Float best = 0.0;
            for (auto const& feed : feeds) {
                Node const& candidate = graph.node(feed);
                if (candidate.type != NodeType::PANELBOARD) continue;
                Float const d = distance(candidate.location, load.location);
                if (keep.empty() || d < best ||
                    (d == best && graph.node_index(feed) < graph.node_index(keep))) {
                    keep = feed;
                    best = d;
                }
            }
            if (keep.empty()) keep = *nearest;
            message = feeds.size() > 1 ? "Load had multiple feeds"
                                       : "Load was not fed by a panelboard";
        }

        for (auto const& feed : feeds) {
            if (feed != keep) graph.remove_edge(feed, load_id);
        }
        if (!graph.has_edge(keep, load_id)) {
            attach_to_panelboard(graph, load, keep);
        }

        report.structure_changed = true;
        report.records.push_back(
            {RULE_LOAD_FEED, Severity::REPAIRED, load_id, join(feeds), keep, message});
        LOG_INFO(logger, "Repaired feed of", load_id, ":", join(feeds), "->", keep);
    }
}

}  // namespace mepg::electrical
