#include <chrono>
#include <cstdint>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>

#include "mepg/core/errors.h"
#include "mepg/core/graph_summary.h"
#include "mepg/core/synthesizer.h"
#include "mepg/core/types.h"
#include "mepg/core/writer_factory.h"
#include "mepg/logging/log_config.h"
#include "mepg/logging/logger.h"

using namespace mepg;

/**
 * @brief Configuration structure for the application
 */
struct AppConfig {
    int node_count = 0;
    std::optional<std::uint64_t> seed;
    std::string filename;                    // Derived from the parameters when empty
    std::string output_dir = "graph_outputs";
    BuildingParameters building;
    std::optional<Float> core_x;
    std::optional<Float> core_y;
    std::optional<Float> core_size;
    core::SynthesisConfig synthesis;
    OutputFormat format = OutputFormat::GRAPHML;
    bool verbose = false;
};

/**
 * @brief Print usage information
 */
void print_usage(char const* program_name) {
    std::cout << "Usage: " << program_name << " NODE_COUNT [OPTIONS]\n"
              << "\nOPTIONS:\n"
              << "  -s, --seed N            Random seed (default: drawn from the system)\n"
              << "  -f, --filename NAME     Output file name (default: derived from parameters)\n"
              << "  -o, --output-dir DIR    Output directory (default: graph_outputs)\n"
              << "  --length M              Building length in metres (default: 50)\n"
              << "  --width M               Building width in metres (default: 30)\n"
              << "  --floor-height M        Floor-to-floor height in metres (default: 3.5)\n"
              << "  --floors N              Floors above grade (default: 5)\n"
              << "  --basement-depth M      Basement depth in metres (default: 4)\n"
              << "  --core-x M              Electrical core center x (default: length / 2)\n"
              << "  --core-y M              Electrical core center y (default: width / 2)\n"
              << "  --core-size M           Electrical core side length (default: 6)\n"
              << "  --total-load KW         Scale distributed loads to this total\n"
              << "  --construction-year Y   Installation year of the equipment (default: 2024)\n"
              << "  --format FMT            Output format: graphml, json (default: graphml)\n"
              << "  -v, --verbose           Enable verbose output\n"
              << "  -h, --help              Show this help message\n"
              << "\nEXAMPLES:\n"
              << "  " << program_name << " 40 --seed 1\n"
              << "  " << program_name << " 120 --floors 12 --length 50 --width 40 -f tower\n"
              << std::endl;
}

namespace {

std::string require_value(int argc, char* argv[], int& i, std::string const& arg) {
    if (i + 1 >= argc) {
        throw std::invalid_argument("Missing value for " + arg);
    }
    return argv[++i];
}

Float parse_float(std::string const& text, std::string const& arg) {
    size_t consumed = 0;
    Float value = std::stod(text, &consumed);
    if (consumed != text.size()) {
        throw std::invalid_argument("Invalid number for " + arg + ": " + text);
    }
    return value;
}

long long parse_integer(std::string const& text, std::string const& arg) {
    size_t consumed = 0;
    long long value = std::stoll(text, &consumed);
    if (consumed != text.size()) {
        throw std::invalid_argument("Invalid integer for " + arg + ": " + text);
    }
    return value;
}

std::string format_number(Float value) {
    std::ostringstream oss;
    oss << value;
    return oss.str();
}

std::string default_filename(AppConfig const& config, std::uint64_t seed) {
    auto const now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::ostringstream oss;
    oss << "mep_graph_" << std::put_time(std::localtime(&now), "%Y%m%d_%H%M%S") << "_seed_" << seed
        << "_nodes_" << config.node_count << "_length_" << format_number(config.building.length)
        << "_width_" << format_number(config.building.width) << "_floors_"
        << config.building.floor_count;
    return oss.str();
}

}  // namespace

/**
 * @brief Parse command line arguments
 */
AppConfig parse_arguments(int argc, char* argv[]) {
    AppConfig config;
    bool have_node_count = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            exit(0);
        } else if (arg == "-s" || arg == "--seed") {
            long long seed = parse_integer(require_value(argc, argv, i, arg), arg);
            if (seed < 0) throw std::invalid_argument("Seed must not be negative");
            config.seed = static_cast<std::uint64_t>(seed);
        } else if (arg == "-f" || arg == "--filename") {
            config.filename = require_value(argc, argv, i, arg);
        } else if (arg == "-o" || arg == "--output-dir") {
            config.output_dir = require_value(argc, argv, i, arg);
        } else if (arg == "--length") {
            config.building.length = parse_float(require_value(argc, argv, i, arg), arg);
        } else if (arg == "--width") {
            config.building.width = parse_float(require_value(argc, argv, i, arg), arg);
        } else if (arg == "--floor-height") {
            config.building.floor_height = parse_float(require_value(argc, argv, i, arg), arg);
        } else if (arg == "--floors") {
            config.building.floor_count =
                static_cast<int>(parse_integer(require_value(argc, argv, i, arg), arg));
        } else if (arg == "--basement-depth") {
            config.building.basement_depth = parse_float(require_value(argc, argv, i, arg), arg);
        } else if (arg == "--core-x") {
            config.core_x = parse_float(require_value(argc, argv, i, arg), arg);
        } else if (arg == "--core-y") {
            config.core_y = parse_float(require_value(argc, argv, i, arg), arg);
        } else if (arg == "--core-size") {
            config.core_size = parse_float(require_value(argc, argv, i, arg), arg);
        } else if (arg == "--total-load") {
            config.synthesis.target_total_load = parse_float(require_value(argc, argv, i, arg), arg);
        } else if (arg == "--construction-year") {
            config.synthesis.construction_year =
                static_cast<int>(parse_integer(require_value(argc, argv, i, arg), arg));
        } else if (arg == "--format") {
            config.format = output_format_from_string(require_value(argc, argv, i, arg));
        } else if (arg == "-v" || arg == "--verbose") {
            config.verbose = true;
        } else if (!arg.empty() && arg[0] == '-') {
            throw std::invalid_argument("Unknown argument: " + arg);
        } else if (!have_node_count) {
            config.node_count = static_cast<int>(parse_integer(arg, "NODE_COUNT"));
            have_node_count = true;
        } else {
            throw std::invalid_argument("Unexpected argument: " + arg);
        }
    }

    if (!have_node_count) {
        throw std::invalid_argument("NODE_COUNT is required");
    }

    if (config.core_x || config.core_y || config.core_size) {
        CoreFootprint core;
        core.x_center = config.core_x.value_or(config.building.length / 2.0);
        core.y_center = config.core_y.value_or(config.building.width / 2.0);
        core.size = config.core_size.value_or(core.size);
        config.building.core = core;
    }

    return config;
}

/**
 * @brief Generate the graph, write it and print the summary
 */
int run_generation(AppConfig const& config) {
    auto& logger = mepg::logging::global_logger;
    logging::ComponentScope scope(logger, "MEPG");

    try {
        if (config.verbose) {
            LOG_INFO(logger, "MEPG Electrical Topology Generator");
            LOG_INFO(logger, "  Target nodes:", config.node_count);
            LOG_INFO(logger, "  Building:", config.building.length, "x", config.building.width,
                     "m,", config.building.floor_count, "floors");
            LOG_INFO(logger, "  Output directory:", config.output_dir);
            LOG_INFO(logger, "  Format:", output_format_to_string(config.format));
        }

        auto start_time = std::chrono::high_resolution_clock::now();

        core::TopologySynthesizer synthesizer(config.synthesis);
        auto result = synthesizer.generate(config.building, config.node_count, config.seed);

        auto writer = core::WriterFactory::create_writer(config.format);
        std::string filename =
            config.filename.empty() ? default_filename(config, result.seed) : config.filename;
        if (std::filesystem::path(filename).extension() != writer->default_extension()) {
            filename += writer->default_extension();
        }

        std::filesystem::create_directories(config.output_dir);
        auto const path = (std::filesystem::path(config.output_dir) / filename).string();
        writer->write_graph(path, result.graph);

        auto end_time = std::chrono::high_resolution_clock::now();
        auto duration =
            std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);

        std::cout << "\nGenerated electrical distribution graph" << std::endl;
        std::cout << "  Seed: " << result.seed << std::endl;
        std::cout << "  Core strategy: " << core_strategy_to_string(result.core_strategy.kind)
                  << " (" << result.core_strategy.num_cores << " cores)" << std::endl;
        std::cout << "  Requirements: " << result.requirement_count << std::endl;
        core::print_summary(std::cout, core::summarize(result.graph), result.validation);
        std::cout << "\nSaved graph to " << path << std::endl;

        if (config.verbose) {
            std::cout << "  Execution time: " << duration.count() << " ms" << std::endl;
            std::cout << "  Logged warnings: " << logger.messageCount(logging::LogLevel::WARN)
                      << std::endl;
        }

        return 0;

    } catch (std::exception const& e) {
        LOG_ERROR(logger, "Error:", e.what());
        return 1;
    }
}

/**
 * @brief Main entry point
 */
int main(int argc, char* argv[]) {
    try {
        if (argc == 1) {
            std::cout << "MEPG Electrical Topology Generator\n" << std::endl;
            print_usage(argv[0]);
            return 0;
        }

        auto config = parse_arguments(argc, argv);

        if (config.verbose) {
            mepg::logging::LogConfig::forDevelopment();
        } else {
            mepg::logging::LogConfig::fromEnvironment();
        }

        return run_generation(config);

    } catch (std::exception const& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        print_usage(argv[0]);
        return 1;
    }
}
