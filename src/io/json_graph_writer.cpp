#include "mepg/io/json_graph_writer.h"

#include <cstdio>
#include <fstream>
#include <sstream>

#include "mepg/core/errors.h"
#include "mepg/io/attribute_map.h"
#include "mepg/logging/logger.h"

namespace mepg::io {

namespace {

std::string json_value(AttributeValue const& value) {
    if (std::holds_alternative<std::string>(value)) {
        return "\"" + escape_json(std::get<std::string>(value)) + "\"";
    }
    return attribute_text(value);
}

void write_members(std::ostream& out, AttributeList const& attrs, bool leading_comma) {
    bool first = !leading_comma;
    for (auto const& [name, value] : attrs) {
        if (!first) out << ", ";
        first = false;
        out << "\"" << escape_json(name) << "\": " << json_value(value);
    }
}

}  // namespace

std::string escape_json(std::string const& text) {
    std::string escaped;
    escaped.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '"':
                escaped += "\\\"";
                break;
            case '\\':
                escaped += "\\\\";
                break;
            case '\n':
                escaped += "\\n";
                break;
            case '\r':
                escaped += "\\r";
                break;
            case '\t':
                escaped += "\\t";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char code[8];
                    std::snprintf(code, sizeof(code), "\\u%04x", static_cast<unsigned>(c));
                    escaped += code;
                } else {
                    escaped += c;
                }
        }
    }
    return escaped;
}

void JsonGraphWriter::write_graph(std::ostream& out, graph::Graph const& graph) {
    require_energized(graph);

    std::ostringstream body;
    body << "{\n  \"directed\": true,\n  \"multigraph\": false,\n  \"graph\": {";
    write_members(body, flatten_metadata(graph.metadata()), false);
    body << "},\n  \"nodes\": [";

    bool first = true;
    for (auto const& node : graph.nodes()) {
        body << (first ? "\n" : ",\n") << "    {\"id\": \"" << escape_json(node.id) << "\"";
        write_members(body, flatten_node(node), true);
        body << "}";
        first = false;
    }
    body << "\n  ],\n  \"links\": [";

    first = true;
    for (auto const& edge : graph.edges()) {
        body << (first ? "\n" : ",\n") << "    {\"source\": \"" << escape_json(edge.source)
             << "\", \"target\": \"" << escape_json(edge.target) << "\"";
        write_members(body, flatten_edge(edge), true);
        body << "}";
        first = false;
    }
    body << "\n  ]\n}\n";

    out << body.str();
}

void JsonGraphWriter::write_graph(std::string const& filename, graph::Graph const& graph) {
    auto& logger = logging::global_logger;
    logging::ComponentScope scope(logger, "JsonGraphWriter");

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
