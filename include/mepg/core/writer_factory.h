#pragma once

#include <memory>
#include <string>
#include <vector>

#include "mepg/core/types.h"
#include "mepg/io/io_interface.h"

namespace mepg::core {

/**
 * @brief Factory class for creating graph writers
 */
class WriterFactory {
  public:
    /**
     * @brief Create a writer for a persisted format
     * @param format Output format (default: GraphML .mepg)
     * @return Unique pointer to the writer implementation
     */
    static std::unique_ptr<io::IGraphWriter> create_writer(
        OutputFormat format = OutputFormat::GRAPHML);

    /**
     * @brief Pick the format from a file extension; anything but .json is GraphML
     */
    static OutputFormat format_for_filename(std::string const& filename);

    static std::vector<OutputFormat> get_available_formats();
};

}  // namespace mepg::core
