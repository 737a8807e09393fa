#include <cstdio>
#include <fstream>
#include <limits>
#include <sstream>

#include "mepg/core/errors.h"
#include "mepg/core/writer_factory.h"
#include "mepg/electrical/voltage_propagator.h"
#include "mepg/io/attribute_map.h"
#include "mepg/io/graphml_writer.h"
#include "mepg/io/json_graph_writer.h"

#include "graph_fixtures.h"
#include "test_framework.h"

using namespace mepg;
using namespace mepg::io;

namespace {

graph::Graph make_energized_graph() {
    auto graph = fixtures::make_chain_graph();
    electrical::VoltagePropagator(electrical::StandardVoltages{}).propagate(graph);
    auto& meta = graph.metadata();
    meta.generation_id = "mepg-test-42";
    meta.seed = 42;
    meta.building_length = 20.0;
    meta.building_width = 20.0;
    meta.floor_count = 3;
    meta.description = "R&D <lab>";
    return graph;
}

bool contains(std::string const& text, std::string const& fragment) {
    return text.find(fragment) != std::string::npos;
}

}  // namespace

void test_writer_factory() {
    auto graphml = core::WriterFactory::create_writer();
    ASSERT_TRUE(graphml != nullptr);
    ASSERT_EQ(OutputFormat::GRAPHML, graphml->format());
    ASSERT_EQ(".mepg", graphml->default_extension());

    auto json = core::WriterFactory::create_writer(OutputFormat::JSON);
    ASSERT_EQ(".json", json->default_extension());

    ASSERT_EQ(OutputFormat::JSON, core::WriterFactory::format_for_filename("out/graph.json"));
    ASSERT_EQ(OutputFormat::GRAPHML, core::WriterFactory::format_for_filename("out/graph.mepg"));
    ASSERT_EQ(OutputFormat::GRAPHML, core::WriterFactory::format_for_filename("graph"));
    ASSERT_EQ(2, core::WriterFactory::get_available_formats().size());
}

void test_output_format_names() {
    ASSERT_EQ(OutputFormat::GRAPHML, output_format_from_string("graphml"));
    ASSERT_EQ(OutputFormat::GRAPHML, output_format_from_string("mepg"));
    ASSERT_EQ(OutputFormat::JSON, output_format_from_string("json"));
    ASSERT_THROWS(output_format_from_string("xml"), std::invalid_argument);
}

void test_escaping() {
    ASSERT_EQ("a&lt;b&amp;&quot;c&quot;", escape_xml("a<b&\"c\""));
    ASSERT_EQ("it&apos;s", escape_xml("it's"));
    ASSERT_EQ("line\\n\\\"q\\\"", escape_json("line\n\"q\""));
    ASSERT_EQ("tab\\tback\\\\", escape_json("tab\tback\\"));
}

void test_attribute_values() {
    ASSERT_EQ("string", attribute_type(AttributeValue{std::string("x")}));
    ASSERT_EQ("double", attribute_type(AttributeValue{1.5}));
    ASSERT_EQ("int", attribute_type(AttributeValue{3}));
    ASSERT_EQ("boolean", attribute_type(AttributeValue{true}));

    ASSERT_EQ("480", attribute_text(AttributeValue{480.0}));
    ASSERT_EQ("0.25", attribute_text(AttributeValue{0.25}));
    ASSERT_EQ("false", attribute_text(AttributeValue{false}));
    ASSERT_THROWS(attribute_text(AttributeValue{std::numeric_limits<Float>::quiet_NaN()}),
                  SerializationError);
}

void test_flattened_node_is_complete() {
    auto graph = make_energized_graph();

    auto attrs = flatten_node(graph.node("load_001"));
    bool has_load_type = false;
    bool has_voltage = false;
    for (auto const& [name, value] : attrs) {
        if (name == "load_type") {
            has_load_type = true;
            ASSERT_EQ("general_power", std::get<std::string>(value));
        }
        if (name == "upstream_voltage") {
            has_voltage = true;
            ASSERT_NEAR(208.0, std::get<Float>(value), 1e-12);
        }
    }
    ASSERT_TRUE(has_load_type);
    ASSERT_TRUE(has_voltage);

    auto edge_attrs = flatten_edge(graph.edges().front());
    ASSERT_EQ(9, edge_attrs.size());
    ASSERT_EQ("connection_type", edge_attrs.front().first);
}

void test_graphml_output() {
    auto graph = make_energized_graph();
    std::ostringstream out;
    GraphMLWriter().write_graph(out, graph);
    auto const text = out.str();

    ASSERT_TRUE(contains(text, "<?xml version=\"1.0\" encoding=\"UTF-8\"?>"));
    ASSERT_TRUE(contains(text, "<graph id=\"G\" edgedefault=\"directed\">"));
    ASSERT_TRUE(contains(text,
                         "<key id=\"n_type\" for=\"node\" attr.name=\"type\" attr.type=\"string\"/>"));
    ASSERT_TRUE(contains(text, "<key id=\"e_voltage\" for=\"edge\" attr.name=\"voltage\" "
                               "attr.type=\"double\"/>"));
    ASSERT_TRUE(contains(text, "<data key=\"g_seed\">42</data>"));
    ASSERT_TRUE(contains(text, "<data key=\"g_description\">R&amp;D &lt;lab&gt;</data>"));
    ASSERT_TRUE(contains(text, "<node id=\"transformer_001\">"));
    ASSERT_TRUE(contains(text, "<edge source=\"transformer_001\" target=\"switchboard_001\">"));
    ASSERT_TRUE(contains(text, "<data key=\"e_voltage\">480</data>"));
    ASSERT_TRUE(contains(text, "</graphml>"));

    // One key declaration per attribute name and domain
    size_t first = text.find("attr.name=\"type\"");
    ASSERT_TRUE(first != std::string::npos);
    ASSERT_TRUE(text.find("attr.name=\"type\"", first + 1) == std::string::npos);
}

void test_json_output() {
    auto graph = make_energized_graph();
    std::ostringstream out;
    JsonGraphWriter().write_graph(out, graph);
    auto const text = out.str();

    ASSERT_TRUE(contains(text, "\"directed\": true"));
    ASSERT_TRUE(contains(text, "\"multigraph\": false"));
    ASSERT_TRUE(contains(text, "\"generation_id\": \"mepg-test-42\""));
    ASSERT_TRUE(contains(text, "{\"id\": \"load_001\", \"type\": \"load\""));
    ASSERT_TRUE(contains(text, "{\"source\": \"panelboard_001\", \"target\": \"load_001\""));
    ASSERT_TRUE(contains(text, "\"rated_as_switchboard\": false"));
    ASSERT_FALSE(contains(text, "null"));
}

void test_writers_refuse_provisional_graph() {
    auto graph = fixtures::make_chain_graph();
    std::ostringstream out;
    ASSERT_THROWS(GraphMLWriter().write_graph(out, graph), SerializationError);
    ASSERT_THROWS(JsonGraphWriter().write_graph(out, graph), SerializationError);
    ASSERT_TRUE(out.str().empty());

    auto energized = make_energized_graph();
    energized.edges().back().energized = false;
    ASSERT_THROWS(GraphMLWriter().write_graph(out, energized), SerializationError);
}

void test_graph_file_writing() {
    auto graph = make_energized_graph();
    std::string const test_file = "test_graph_output.mepg";

    auto writer = core::WriterFactory::create_writer(core::WriterFactory::format_for_filename(test_file));
    writer->write_graph(test_file, graph);

    std::ifstream file(test_file);
    ASSERT_TRUE(file.is_open());
    std::string first_line;
    std::getline(file, first_line);
    ASSERT_EQ("<?xml version=\"1.0\" encoding=\"UTF-8\"?>", first_line);
    file.close();

    // Clean up
    std::remove(test_file.c_str());

    ASSERT_THROWS(writer->write_graph("missing_dir/nested/graph.mepg", graph), SerializationError);
}

void register_io_tests(TestRunner& runner) {
    runner.add_test("Writer Factory", test_writer_factory);
    runner.add_test("Output Format Names", test_output_format_names);
    runner.add_test("Escaping", test_escaping);
    runner.add_test("Attribute Values", test_attribute_values);
    runner.add_test("Flattened Node Is Complete", test_flattened_node_is_complete);
    runner.add_test("GraphML Output", test_graphml_output);
    runner.add_test("JSON Output", test_json_output);
    runner.add_test("Writers Refuse Provisional Graph", test_writers_refuse_provisional_graph);
    runner.add_test("Graph File Writing", test_graph_file_writing);
}
