/**
 * @file mepg_bindings.cpp
 * @brief Main pybind11 bindings for the MEPG topology synthesizer
 *
 * Exposes building parameters, the synthesis pipeline and the graph writers so
 * that generated graphs can be consumed directly from Python.
 */

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <cstdint>
#include <optional>
#include <string>

#include "mepg/core/synthesizer.h"
#include "mepg/core/types.h"
#include "mepg/core/writer_factory.h"
#include "mepg/logging/log_config.h"

// Forward declarations for modular bindings
void init_core_types(pybind11::module& m);
void init_io_bindings(pybind11::module& m);

namespace py = pybind11;
using namespace mepg;

PYBIND11_MODULE(mepg_synth, m) {
    m.doc() = "MEPG Electrical Topology Synthesizer - Python Bindings";

    // Module metadata
    m.attr("__version__") = py::str(VERSION_INFO);

    // Initialize core type bindings
    init_core_types(m);

    // Initialize I/O bindings
    init_io_bindings(m);

    // Utility functions
    m.def(
        "get_available_formats", []() { return core::WriterFactory::get_available_formats(); },
        "Get list of available output formats");

    m.def(
        "configure_logging",
        [](std::string const& level, std::string const& output, std::string const& filename) {
            using namespace mepg::logging;
            Logger::getInstance().configure(LogConfig::parseLevel(level, LogLevel::WARN),
                                            LogConfig::parseOutput(output), filename);
        },
        "Set the synthesizer log level (TRACE..ERROR, OFF) and destination", py::arg("level"),
        py::arg("output") = "CONSOLE", py::arg("filename") = "mepg.log");

    m.def(
        "generate",
        [](BuildingParameters const& params, int node_count, std::optional<std::uint64_t> seed,
           core::SynthesisConfig const& config) {
            core::TopologySynthesizer synthesizer(config);
            return synthesizer.generate(params, node_count, seed);
        },
        "Generate an energized electrical distribution graph", py::arg("params"),
        py::arg("node_count"), py::arg("seed") = py::none(),
        py::arg("config") = core::SynthesisConfig{});
}
