#pragma once

#include <stdexcept>
#include <string>

namespace pi_blocks {

/**
 * @brief Rejected engine configuration (non-positive mass, invalid state)
 */
class InvalidConfiguration : public std::invalid_argument {
public:
    explicit InvalidConfiguration(const std::string& what) : std::invalid_argument(what) {}
};

/**
 * @brief Rejected operation argument (non-positive time step)
 */
class InvalidArgument : public std::invalid_argument {
public:
    explicit InvalidArgument(const std::string& what) : std::invalid_argument(what) {}
};

} // namespace pi_blocks
