#include "mepg/core/types.h"

#include <stdexcept>

namespace mepg {

std::string node_type_to_string(NodeType type) {
    switch (type) {
        case NodeType::TRANSFORMER:
            return "transformer";
        case NodeType::SWITCHBOARD:
            return "switchboard";
        case NodeType::PANELBOARD:
            return "panelboard";
        case NodeType::LOAD:
            return "load";
        default:
            return "unknown";
    }
}

std::string node_subtype_to_string(NodeSubtype subtype) {
    switch (subtype) {
        case NodeSubtype::MAIN:
            return "main";
        case NodeSubtype::SECONDARY:
            return "secondary";
        case NodeSubtype::DISTRIBUTION:
            return "distribution";
        case NodeSubtype::LIGHTING:
            return "lighting";
        case NodeSubtype::POWER:
            return "power";
        case NodeSubtype::GENERIC:
            return "generic";
        case NodeSubtype::END_LOAD:
            return "end_load";
        default:
            return "unknown";
    }
}

std::string voltage_class_to_string(VoltageClass voltage_class) {
    switch (voltage_class) {
        case VoltageClass::HIGH:
            return "high";
        case VoltageClass::MEDIUM:
            return "medium";
        case VoltageClass::LOW:
            return "low";
        default:
            return "unknown";
    }
}

std::string load_type_to_string(LoadType load_type) {
    switch (load_type) {
        case LoadType::MAIN_SERVICE:
            return "main_service";
        case LoadType::HVAC:
            return "hvac";
        case LoadType::LIGHTING:
            return "lighting";
        case LoadType::GENERAL_POWER:
            return "general_power";
        case LoadType::KITCHEN:
            return "kitchen";
        case LoadType::DATA_CENTER:
            return "data_center";
        default:
            return "unknown";
    }
}

std::string load_type_label(LoadType load_type) {
    switch (load_type) {
        case LoadType::MAIN_SERVICE:
            return "Main Service";
        case LoadType::HVAC:
            return "HVAC";
        case LoadType::LIGHTING:
            return "Lighting";
        case LoadType::GENERAL_POWER:
            return "General Power";
        case LoadType::KITCHEN:
            return "Kitchen";
        case LoadType::DATA_CENTER:
            return "Data Center";
        default:
            return "Unknown";
    }
}

std::string core_strategy_to_string(CoreStrategyKind kind) {
    switch (kind) {
        case CoreStrategyKind::SINGLE_CORE:
            return "single_core";
        case CoreStrategyKind::DUAL_CORE:
            return "dual_core";
        case CoreStrategyKind::MULTI_CORE:
            return "multi_core";
        default:
            return "unknown";
    }
}

std::string output_format_to_string(OutputFormat format) {
    switch (format) {
        case OutputFormat::GRAPHML:
            return "graphml";
        case OutputFormat::JSON:
            return "json";
        default:
            return "unknown";
    }
}

OutputFormat output_format_from_string(std::string const& name) {
    if (name == "graphml" || name == "mepg") return OutputFormat::GRAPHML;
    if (name == "json") return OutputFormat::JSON;
    throw std::invalid_argument("Unknown output format: " + name);
}

}  // namespace mepg
