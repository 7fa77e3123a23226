/**
 * Copyright EduArt Robotik GmbH 2024
 *
 * Author: Christian Wendt (christian.wendt@eduart-robotik.com)
 */
#pragma once

#include "taskboard_perception/geometry/rectangle.hpp"

#include <Eigen/Core>

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace taskboard {
namespace perception {
namespace orientation {

using LandmarkPositions2D = std::map<std::string, Eigen::Vector2f>;

/**
 * \brief Decides which side of the fitted board rectangle is the board's horizontal (x) and which is its vertical
 *        (y) direction. A rectangle alone is symmetric under rotations of 180° (90° if it is a square).
 */
class AxisDisambiguation
{
public:
  struct Result {
    bool horizontal_side_found = false;
    bool vertical_side_found = false;
    // Board axes given in plane coordinates. y_axis is x_axis rotated by +90°.
    Eigen::Vector2f x_axis = Eigen::Vector2f::UnitX();
    Eigen::Vector2f y_axis = Eigen::Vector2f::UnitY();
  };

  virtual ~AxisDisambiguation() = default;

  /**
   * \param rectangle Board rectangle in plane coordinates.
   * \param landmarks Positions of detected objects projected into the same plane coordinates.
   */
  virtual Result resolve(const geometry::Rectangle& rectangle, const LandmarkPositions2D& landmarks) const = 0;
};

/**
 * \brief Uses the known layout of landmarks on the board.
 *
 * The layout contains the nominal position of each landmark relative to the board center, seen from the front:
 *
 *       y ^
 *         |   o red
 *         |
 * --------+--------> x
 *         |
 *         o white_center
 *
 * All four 90° rotations of the rectangle's axes are tested and the one with the smallest squared landmark residual
 * is taken. A side is found if at least one visible landmark has a nominal offset of min_landmark_offset along it
 * and all those landmarks are measured on the nominal side of the board center.
 */
class LandmarkLayoutDisambiguation : public AxisDisambiguation
{
public:
  struct Parameter {
    std::map<std::string, Eigen::Vector2f> layout = {
      { "red",          Eigen::Vector2f(-0.075f,  0.06f) },
      { "white_center", Eigen::Vector2f( 0.0f,   -0.04f) }
    };
    float min_landmark_offset = 0.02f;
  };

  explicit LandmarkLayoutDisambiguation(const Parameter& parameter);
  ~LandmarkLayoutDisambiguation() override = default;

  Result resolve(const geometry::Rectangle& rectangle, const LandmarkPositions2D& landmarks) const override;

private:
  bool isSideFound(
    const std::vector<std::pair<Eigen::Vector2f, Eigen::Vector2f>>& visible, const Eigen::Vector2f& axis,
    const int component) const;

  const Parameter _parameter;
};

} // end namespace orientation
} // end namespace perception
} // end namespace taskboard
