#include "mepg/core/writer_factory.h"

#include <filesystem>
#include <stdexcept>

#include "mepg/io/graphml_writer.h"
#include "mepg/io/json_graph_writer.h"

namespace mepg::core {

std::unique_ptr<io::IGraphWriter> WriterFactory::create_writer(OutputFormat format) {
    switch (format) {
        case OutputFormat::GRAPHML:
            return std::make_unique<io::GraphMLWriter>();
        case OutputFormat::JSON:
            return std::make_unique<io::JsonGraphWriter>();
        default:
            throw std::invalid_argument("Unknown output format");
    }
}

OutputFormat WriterFactory::format_for_filename(std::string const& filename) {
    auto const extension = std::filesystem::path(filename).extension().string();
    if (extension == ".json") return OutputFormat::JSON;
    return OutputFormat::GRAPHML;
}

std::vector<OutputFormat> WriterFactory::get_available_formats() {
    return {OutputFormat::GRAPHML, OutputFormat::JSON};
}

}  // namespace mepg::core
