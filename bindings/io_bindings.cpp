/**
 * @file io_bindings.cpp
 * @brief I/O module bindings for MEPG
 */

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <sstream>

#include "mepg/core/writer_factory.h"
#include "mepg/io/io_interface.h"

namespace py = pybind11;
using namespace mepg;
using namespace mepg::io;

void init_io_bindings(pybind11::module& m) {
    // Writer interface
    py::class_<IGraphWriter>(m, "IGraphWriter")
        .def("write_graph",
             py::overload_cast<std::string const&, graph::Graph const&>(&IGraphWriter::write_graph),
             "Write an energized graph to file", py::arg("filename"), py::arg("graph"))
        .def("default_extension", &IGraphWriter::default_extension)
        .def("format", &IGraphWriter::format);

    // Factory function for writers
    m.def(
        "create_writer",
        [](OutputFormat format) { return core::WriterFactory::create_writer(format); },
        "Create a graph writer for the given format", py::arg("format") = OutputFormat::GRAPHML);

    // Convenience functions for direct file operations
    m.def(
        "save_graph",
        [](std::string const& filename, graph::Graph const& graph) {
            auto writer =
                core::WriterFactory::create_writer(core::WriterFactory::format_for_filename(filename));
            writer->write_graph(filename, graph);
        },
        "Save a graph, choosing the format from the file extension", py::arg("filename"),
        py::arg("graph"));

    m.def(
        "graph_to_string",
        [](graph::Graph const& graph, OutputFormat format) {
            std::ostringstream out;
            core::WriterFactory::create_writer(format)->write_graph(out, graph);
            return out.str();
        },
        "Serialize a graph to a string", py::arg("graph"), py::arg("format") = OutputFormat::GRAPHML);
}
