#pragma once

#include <ostream>
#include <string>

#include "mepg/io/io_interface.h"

namespace mepg::io {

/**
 * @brief Writes the graph as node-link JSON
 *
 * Layout: {"directed", "multigraph", "graph": {...}, "nodes": [...], "links": [...]}.
 */
class JsonGraphWriter : public IGraphWriter {
  public:
    void write_graph(std::string const& filename, graph::Graph const& graph) override;
    void write_graph(std::ostream& out, graph::Graph const& graph) override;

    std::string default_extension() const override { return ".json"; }
    OutputFormat format() const override { return OutputFormat::JSON; }
};

std::string escape_json(std::string const& text);

}  // namespace mepg::io
