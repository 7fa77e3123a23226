#include "taskboard_perception/orientation/axis_disambiguation.hpp"

#include <cmath>
#include <limits>
#include <utility>
#include <vector>

namespace taskboard {
namespace perception {
namespace orientation {

LandmarkLayoutDisambiguation::LandmarkLayoutDisambiguation(const Parameter& parameter)
  : _parameter(parameter)
{

}

AxisDisambiguation::Result LandmarkLayoutDisambiguation::resolve(
  const geometry::Rectangle& rectangle, const LandmarkPositions2D& landmarks) const
{
  // pairs of (measured offset from board center, nominal offset)
  std::vector<std::pair<Eigen::Vector2f, Eigen::Vector2f>> visible;

  for (const auto& landmark : landmarks) {
    const auto nominal = _parameter.layout.find(landmark.first);

    if (nominal != _parameter.layout.end()) {
      visible.emplace_back(landmark.second - rectangle.center, nominal->second);
    }
  }

  Result result;

  if (visible.empty()) {
    return result;
  }

  float min_residual = std::numeric_limits<float>::max();

  for (int quarter_turns = 0; quarter_turns < 4; ++quarter_turns) {
    const Eigen::Vector2f x_axis = rectangle.axisRotated(quarter_turns);
    const Eigen::Vector2f y_axis(-x_axis.y(), x_axis.x());
    float residual = 0.0f;

    for (const auto& landmark : visible) {
      const Eigen::Vector2f measured_in_board(landmark.first.dot(x_axis), landmark.first.dot(y_axis));
      residual += (measured_in_board - landmark.second).squaredNorm();
    }

    if (residual < min_residual) {
      min_residual = residual;
      result.x_axis = x_axis;
      result.y_axis = y_axis;
    }
  }

  result.horizontal_side_found = isSideFound(visible, result.x_axis, 0);
  result.vertical_side_found = isSideFound(visible, result.y_axis, 1);

  return result;
}

bool LandmarkLayoutDisambiguation::isSideFound(
  const std::vector<std::pair<Eigen::Vector2f, Eigen::Vector2f>>& visible, const Eigen::Vector2f& axis,
  const int component) const
{
  bool found = false;

  for (const auto& landmark : visible) {
    const float nominal = landmark.second(component);

    if (std::abs(nominal) < _parameter.min_landmark_offset) {
      // Landmark lies (nearly) on the other axis, it can't tell the direction of this one.
      continue;
    }

    const float measured = landmark.first.dot(axis);

    if (std::signbit(measured) != std::signbit(nominal)
        || std::abs(measured) < 0.5f * _parameter.min_landmark_offset) {
      return false;
    }

    found = true;
  }

  return found;
}

} // end namespace orientation
} // end namespace perception
} // end namespace taskboard
