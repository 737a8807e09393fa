#pragma once

#include <stdexcept>
#include <string>

namespace mepg {

/**
 * @brief Building parameters or node count rejected before construction
 */
class InvalidParameter : public std::invalid_argument {
  public:
    explicit InvalidParameter(std::string const& message) : std::invalid_argument(message) {}
};

/**
 * @brief Graph cannot be written in the persisted format
 */
class SerializationError : public std::runtime_error {
  public:
    explicit SerializationError(std::string const& message) : std::runtime_error(message) {}
};

}  // namespace mepg
