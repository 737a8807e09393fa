#include "mepg/core/graph_summary.h"

#include <algorithm>
#include <iomanip>

namespace mepg::core {

GraphSummary summarize(graph::Graph const& graph) {
    GraphSummary summary;
    summary.node_count = graph.node_count();
    summary.edge_count = graph.edge_count();

    for (auto const& node : graph.nodes()) {
        ++summary.type_counts[node_type_to_string(node.type)];
    }

    auto const sources = graph.sources();
    summary.source_count = sources.size();
    for (auto const& id : sources) {
        summary.total_demand += graph.node(id).demand;
    }

    if (!graph.edges().empty()) {
        summary.min_cable_distance = graph.edges().front().cable_distance;
        summary.max_cable_distance = graph.edges().front().cable_distance;
        for (auto const& edge : graph.edges()) {
            summary.min_cable_distance = std::min(summary.min_cable_distance, edge.cable_distance);
            summary.max_cable_distance = std::max(summary.max_cable_distance, edge.cable_distance);
            summary.total_cable_distance += edge.cable_distance;
        }
        summary.mean_cable_distance =
            summary.total_cable_distance / static_cast<Float>(graph.edges().size());
    }
    return summary;
}

void print_summary(std::ostream& out, GraphSummary const& summary,
                   electrical::ValidationReport const& validation) {
    out << "\nGraph Summary:" << std::endl;
    out << "  Nodes: " << summary.node_count << std::endl;
    out << "  Edges: " << summary.edge_count << std::endl;
    out << "  Sources: " << summary.source_count << std::endl;
    for (auto const& [type, count] : summary.type_counts) {
        out << "    " << std::left << std::setw(12) << type << count << std::endl;
    }

    out << std::fixed << std::setprecision(2);
    out << "  Total demand: " << summary.total_demand << " kW" << std::endl;
    out << "  Cable distance (m):" << std::endl;
    out << "    min   " << summary.min_cable_distance << std::endl;
    out << "    max   " << summary.max_cable_distance << std::endl;
    out << "    mean  " << summary.mean_cable_distance << std::endl;
    out << "    total " << summary.total_cable_distance << std::endl;

    out << "  Validation: " << validation.repair_count() << " repairs, "
        << validation.warning_count() << " warnings" << std::endl;
    for (auto const& record : validation.records) {
        out << "    [" << electrical::severity_to_string(record.severity) << "] " << record.rule
            << " " << record.node_id << ": " << record.message;
        if (record.severity == electrical::Severity::REPAIRED) {
            out << " (" << record.before << " -> " << record.after << ")";
        }
        out << std::endl;
    }
    out << std::defaultfloat;
}

}  // namespace mepg::core
