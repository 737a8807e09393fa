#include "mepg/graph/graph.h"

#include <algorithm>
#include <stdexcept>

namespace mepg::graph {

Node& Graph::add_node(Node node) {
    if (index_.count(node.id) > 0) {
        throw std::invalid_argument("Duplicate node id: " + node.id);
    }
    index_.emplace(node.id, nodes_.size());
    nodes_.push_back(std::move(node));
    return nodes_.back();
}

bool Graph::has_node(std::string const& id) const { return index_.count(id) > 0; }

Node& Graph::node(std::string const& id) { return nodes_.at(node_index(id)); }

Node const& Graph::node(std::string const& id) const { return nodes_.at(node_index(id)); }

size_t Graph::node_index(std::string const& id) const {
    auto it = index_.find(id);
    if (it == index_.end()) {
        throw std::out_of_range("Unknown node id: " + id);
    }
    return it->second;
}

Edge& Graph::add_edge(Edge edge) {
    if (!has_node(edge.source) || !has_node(edge.target)) {
        throw std::invalid_argument("Edge endpoint missing: " + edge.source + " -> " +
                                    edge.target);
    }
    if (has_edge(edge.source, edge.target)) {
        throw std::invalid_argument("Duplicate edge: " + edge.source + " -> " + edge.target);
    }
    edges_.push_back(std::move(edge));
    return edges_.back();
}

bool Graph::has_edge(std::string const& source, std::string const& target) const {
    return find_edge(source, target) != nullptr;
}

bool Graph::remove_edge(std::string const& source, std::string const& target) {
    auto it = std::find_if(edges_.begin(), edges_.end(), [&](Edge const& e) {
        return e.source == source && e.target == target;
    });
    if (it == edges_.end()) return false;
    edges_.erase(it);
    return true;
}

Edge* Graph::find_edge(std::string const& source, std::string const& target) {
    for (auto& edge : edges_) {
        if (edge.source == source && edge.target == target) return &edge;
    }
    return nullptr;
}

Edge const* Graph::find_edge(std::string const& source, std::string const& target) const {
    for (auto const& edge : edges_) {
        if (edge.source == source && edge.target == target) return &edge;
    }
    return nullptr;
}

std::vector<std::string> Graph::predecessors(std::string const& id) const {
    std::vector<std::string> result;
    for (auto const& edge : edges_) {
        if (edge.target == id) result.push_back(edge.source);
    }
    return result;
}

std::vector<std::string> Graph::successors(std::string const& id) const {
    std::vector<std::string> result;
    for (auto const& edge : edges_) {
        if (edge.source == id) result.push_back(edge.target);
    }
    return result;
}

size_t Graph::in_degree(std::string const& id) const {
    return static_cast<size_t>(
        std::count_if(edges_.begin(), edges_.end(), [&](Edge const& e) { return e.target == id; }));
}

size_t Graph::out_degree(std::string const& id) const {
    return static_cast<size_t>(
        std::count_if(edges_.begin(), edges_.end(), [&](Edge const& e) { return e.source == id; }));
}

std::vector<std::string> Graph::sources() const {
    std::unordered_map<std::string, size_t> in_degrees;
    for (auto const& edge : edges_) {
        ++in_degrees[edge.target];
    }

    std::vector<std::string> result;
    for (auto const& node : nodes_) {
        if (in_degrees.count(node.id) == 0) result.push_back(node.id);
    }
    return result;
}

std::optional<std::string> nearest_panelboard(Graph const& graph, Point3 const& location) {
    std::optional<std::string> best;
    Float best_distance = 0.0;

    for (auto const& node : graph.nodes()) {
        if (node.type != NodeType::PANELBOARD) continue;
        Float const d = distance(node.location, location);
        // Strict comparison keeps the earliest panelboard on ties
        if (!best || d < best_distance) {
            best = node.id;
            best_distance = d;
        }
    }
    return best;
}

}  // namespace mepg::graph
