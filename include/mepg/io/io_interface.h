#pragma once

#include <memory>
#include <ostream>
#include <string>

#include "mepg/core/types.h"
#include "mepg/graph/graph.h"

namespace mepg::io {

/**
 * @brief Abstract interface for persisting a finished graph
 *
 * Writers emit flat attribute bags only and refuse graphs that still hold
 * provisional nodes or unenergized edges.
 */
class IGraphWriter {
  public:
    virtual ~IGraphWriter() = default;

    /**
     * @brief Write the graph to a file
     * @param filename Path of the output file
     * @throws SerializationError if the graph is not fully energized or the
     *         file cannot be written
     */
    virtual void write_graph(std::string const& filename, graph::Graph const& graph) = 0;

    /**
     * @brief Write the graph to a stream
     */
    virtual void write_graph(std::ostream& out, graph::Graph const& graph) = 0;

    /**
     * @brief File extension including the dot
     */
    virtual std::string default_extension() const = 0;

    virtual OutputFormat format() const = 0;
};

/**
 * @brief Throw SerializationError for provisional nodes or unenergized edges
 */
void require_energized(graph::Graph const& graph);

}  // namespace mepg::io
