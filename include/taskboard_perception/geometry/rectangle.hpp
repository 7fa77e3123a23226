/**
 * Copyright EduArt Robotik GmbH 2024
 *
 * Author: Christian Wendt (christian.wendt@eduart-robotik.com)
 */
#pragma once

#include <Eigen/Core>

#include <vector>

namespace taskboard {
namespace perception {
namespace geometry {

struct Rectangle {
  // Rotates the rectangle's axes by a multiple of 90° (counter clockwise).
  Eigen::Vector2f axisRotated(const int quarter_turns) const;

  Eigen::Vector2f center = Eigen::Vector2f::Zero();
  // Unit axes along the rectangle's sides, axis_b is axis_a rotated by +90°.
  Eigen::Vector2f axis_a = Eigen::Vector2f::UnitX();
  Eigen::Vector2f axis_b = Eigen::Vector2f::UnitY();
  float length_a = 0.0f;
  float length_b = 0.0f;
};

/**
 * \brief Fits the minimum area rectangle enclosing all given points.
 * \param min_side_length Both sides of the fitted rectangle must be at least this long.
 * \throw Throws a DegenerateFitError if there are too few points or the rectangle collapses.
 */
Rectangle fit_min_area_rectangle(const std::vector<Eigen::Vector2f>& points, const float min_side_length);

} // end namespace geometry
} // end namespace perception
} // end namespace taskboard
