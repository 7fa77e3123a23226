/**
 * Copyright EduArt Robotik GmbH 2024
 *
 * Author: Christian Wendt (christian.wendt@eduart-robotik.com)
 */
#pragma once

#include <stdexcept>
#include <string>

namespace taskboard {
namespace perception {

/**
 * \brief Thrown if a plane or rectangle can't be fitted to a point set, e.g. too few or collinear points.
 */
class DegenerateFitError : public std::runtime_error
{
public:
  explicit DegenerateFitError(const std::string& message)
    : std::runtime_error(message)
  { }
};

} // end namespace perception
} // end namespace taskboard
