#include "mepg/io/graphml_writer.h"

#include <fstream>
#include <map>
#include <sstream>
#include <vector>

#include "mepg/core/errors.h"
#include "mepg/io/attribute_map.h"
#include "mepg/logging/logger.h"

namespace mepg::io {

namespace {

struct KeySpec {
    std::string id;
    std::string domain;
    std::string name;
    std::string type;
};

/**
 * @brief Collects key declarations in first-seen order, one per (domain, name)
 */
class KeyRegistry {
  public:
    std::string const& key_for(std::string const& domain, std::string const& name,
                               AttributeValue const& value) {
        auto const lookup = domain + ":" + name;
        auto it = ids_.find(lookup);
        if (it != ids_.end()) return keys_[it->second].id;

        KeySpec key{domain.substr(0, 1) + "_" + name, domain, name, attribute_type(value)};
        ids_.emplace(lookup, keys_.size());
        keys_.push_back(std::move(key));
        return keys_.back().id;
    }

    std::vector<KeySpec> const& keys() const noexcept { return keys_; }

  private:
    std::vector<KeySpec> keys_;
    std::map<std::string, size_t> ids_;
};

void write_data(std::ostream& out, char const* indent, std::string const& key,
                AttributeValue const& value) {
    out << indent << "<data key=\"" << key << "\">" << escape_xml(attribute_text(value))
        << "</data>\n";
}

}  // namespace

std::string escape_xml(std::string const& text) {
    std::string escaped;
    escaped.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&':
                escaped += "&amp;";
                break;
            case '<':
                escaped += "&lt;";
                break;
            case '>':
                escaped += "&gt;";
                break;
            case '"':
                escaped += "&quot;";
                break;
            case '\'':
                escaped += "&apos;";
                break;
            default:
                escaped += c;
        }
    }
    return escaped;
}

void GraphMLWriter::write_graph(std::ostream& out, graph::Graph const& graph) {
    require_energized(graph);

    KeyRegistry registry;
    std::ostringstream body;

    auto const metadata = flatten_metadata(graph.metadata());
    body << "  <graph id=\"G\" edgedefault=\"directed\">\n";
    for (auto const& [name, value] : metadata) {
        write_data(body, "    ", registry.key_for("graph", name, value), value);
    }

    for (auto const& node : graph.nodes()) {
        body << "    <node id=\"" << escape_xml(node.id) << "\">\n";
        for (auto const& [name, value] : flatten_node(node)) {
            write_data(body, "      ", registry.key_for("node", name, value), value);
        }
        body << "    </node>\n";
    }

    for (auto const& edge : graph.edges()) {
        body << "    <edge source=\"" << escape_xml(edge.source) << "\" target=\""
             << escape_xml(edge.target) << "\">\n";
        for (auto const& [name, value] : flatten_edge(edge)) {
            write_data(body, "      ", registry.key_for("edge", name, value), value);
        }
        body << "    </edge>\n";
    }
    body << "  </graph>\n";

    out << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
    out << "<graphml xmlns=\"http://graphml.graphdrawing.org/xmlns\" "
           "xmlns:xsi=\"http://www.w3.org/2001/XMLSchema-instance\" "
           "xsi:schemaLocation=\"http://graphml.graphdrawing.org/xmlns "
           "http://graphml.graphdrawing.org/xmlns/1.0/graphml.xsd\">\n";
    for (auto const& key : registry.keys()) {
        out << "  <key id=\"" << key.id << "\" for=\"" << key.domain << "\" attr.name=\""
            << key.name << "\" attr.type=\"" << key.type << "\"/>\n";
    }
    out << body.str();
    out << "</graphml>\n";
}

void GraphMLWriter::write_graph(std::string const& filename, graph::Graph const& graph) {
    auto& logger = logging::global_logger;
    logging::ComponentScope scope(logger, "GraphMLWriter");

    std::ostringstream buffer;
    write_graph(buffer, graph);

    std::ofstream file(filename);
    if (!file.is_open()) {
        throw SerializationError("Cannot open output file: " + filename);
    }
    file << buffer.str();
    if (!file) {
        throw SerializationError("Failed writing output file: " + filename);
    }

    LOG_INFO(logger, "Wrote", graph.node_count(), "nodes and", graph.edge_count(), "edges to",
             filename);
}

}  // namespace mepg::io
