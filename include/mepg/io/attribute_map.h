#pragma once

#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "mepg/graph/graph.h"

namespace mepg::io {

/**
 * @brief Scalar value of a persisted attribute
 */
using AttributeValue = std::variant<std::string, Float, int, bool>;

/**
 * @brief Ordered flat attribute bag
 */
using AttributeList = std::vector<std::pair<std::string, AttributeValue>>;

/**
 * @brief Common fields followed by the fields of the node's attribute variant
 */
AttributeList flatten_node(graph::Node const& node);

AttributeList flatten_edge(graph::Edge const& edge);

AttributeList flatten_metadata(graph::GraphMetadata const& metadata);

/**
 * @brief GraphML attr.type of a value: string, double, int or boolean
 */
std::string attribute_type(AttributeValue const& value);

/**
 * @brief Text form of a value
 * @throws SerializationError for non-finite numbers
 */
std::string attribute_text(AttributeValue const& value);

}  // namespace mepg::io
