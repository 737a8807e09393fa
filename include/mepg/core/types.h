#pragma once

#include <cmath>
#include <optional>
#include <string>
#include <vector>

namespace mepg {

/**
 * @brief MEPG global precision
 */
using Float = double;

/**
 * @brief Position in building coordinates (m), z relative to grade
 */
struct Point3 {
    Float x = 0.0;
    Float y = 0.0;
    Float z = 0.0;
};

inline Float distance(Point3 const& a, Point3 const& b) {
    Float const dx = a.x - b.x;
    Float const dy = a.y - b.y;
    Float const dz = a.z - b.z;
    return std::sqrt(dx * dx + dy * dy + dz * dz);
}

/**
 * @brief Equipment kind of a decision or graph node
 */
enum class NodeType {
    TRANSFORMER = 0,
    SWITCHBOARD = 1,
    PANELBOARD = 2,
    LOAD = 3
};

/**
 * @brief Role of a piece of equipment within its kind
 */
enum class NodeSubtype {
    MAIN = 0,          // Service entrance transformer or switchboard
    SECONDARY = 1,     // Floor step-down transformer
    DISTRIBUTION = 2,  // Medium voltage floor panel
    LIGHTING = 3,      // Low voltage panel serving lighting
    POWER = 4,         // Low voltage panel serving receptacles
    GENERIC = 5,       // Filler panel added to reach a node count
    END_LOAD = 6
};

/**
 * @brief Coarse voltage class of a requirement
 */
enum class VoltageClass {
    HIGH = 0,    // Utility service
    MEDIUM = 1,  // 480 V class
    LOW = 2      // 208 V class
};

enum class LoadType {
    MAIN_SERVICE = 0,
    HVAC = 1,
    LIGHTING = 2,
    GENERAL_POWER = 3,
    KITCHEN = 4,
    DATA_CENTER = 5
};

enum class CoreStrategyKind {
    SINGLE_CORE = 0,
    DUAL_CORE = 1,
    MULTI_CORE = 2
};

/**
 * @brief Persisted graph format
 */
enum class OutputFormat {
    GRAPHML = 0,  // .mepg
    JSON = 1      // node-link JSON
};

/**
 * @brief Electrical core (riser) footprint supplied with the building
 */
struct CoreFootprint {
    Float x_center = 0.0;
    Float y_center = 0.0;
    Float size = 6.0;  // Side length of the square core (m)
};

/**
 * @brief Raw building parameters as supplied by the caller
 */
struct BuildingParameters {
    Float length = 50.0;                // Footprint extent along x (m)
    Float width = 30.0;                 // Footprint extent along y (m)
    Float floor_height = 3.5;           // Floor-to-floor height (m)
    int floor_count = 5;                // Floors above grade
    Float basement_depth = 4.0;         // Depth of the basement level (m)
    std::optional<CoreFootprint> core;  // Defaults to the footprint center
};

struct CorePosition {
    Float x_center = 0.0;
    Float y_center = 0.0;
    int core_id = 0;
};

/**
 * @brief Number and placement of vertical electrical cores
 */
struct CoreStrategy {
    CoreStrategyKind kind = CoreStrategyKind::SINGLE_CORE;
    int num_cores = 1;
    std::vector<CorePosition> positions;
};

/**
 * @brief One discrete electrical demand derived from the building
 */
struct ElectricalRequirement {
    Float load_kw = 0.0;
    VoltageClass voltage_class = VoltageClass::LOW;
    Point3 location;
    LoadType load_type = LoadType::GENERAL_POWER;
    int floor = 0;
    std::string room;
    int priority = 3;  // 1 = critical
};

/**
 * @brief Planning record for one piece of equipment
 *
 * The id is the position in the collected decision list and carries no
 * business meaning; it only identifies the decision.
 */
struct NodeDecision {
    int id = 0;
    NodeType type = NodeType::LOAD;
    NodeSubtype subtype = NodeSubtype::END_LOAD;
    std::string reason;
    Float capacity_kw = 0.0;
    int floor = 0;
    Point3 location;
    std::vector<int> served;           // Indices into the requirement list
    std::optional<LoadType> load_type;  // Set for load decisions
    std::string room;
    int priority = 3;

    bool operator==(NodeDecision const& other) const noexcept { return id == other.id; }
};

std::string node_type_to_string(NodeType type);
std::string node_subtype_to_string(NodeSubtype subtype);
std::string voltage_class_to_string(VoltageClass voltage_class);
std::string load_type_to_string(LoadType load_type);
std::string core_strategy_to_string(CoreStrategyKind kind);
std::string output_format_to_string(OutputFormat format);

/**
 * @brief Title-cased label used for edge load classification
 */
std::string load_type_label(LoadType load_type);

/**
 * @brief Parse an output format name ("graphml" or "json")
 * @throws std::invalid_argument for unknown names
 */
OutputFormat output_format_from_string(std::string const& name);

}  // namespace mepg
