#pragma once

#include <ostream>
#include <string>

#include "mepg/io/io_interface.h"

namespace mepg::io {

/**
 * @brief Writes the graph as GraphML (.mepg)
 *
 * Every attribute name gets a typed <key> per domain (graph, node, edge);
 * each node and edge writes a <data> element per attribute it carries.
 */
class GraphMLWriter : public IGraphWriter {
  public:
    void write_graph(std::string const& filename, graph::Graph const& graph) override;
    void write_graph(std::ostream& out, graph::Graph const& graph) override;

    std::string default_extension() const override { return ".mepg"; }
    OutputFormat format() const override { return OutputFormat::GRAPHML; }
};

std::string escape_xml(std::string const& text);

}  // namespace mepg::io
