#include "taskboard_perception/geometry/rectangle.hpp"
#include "taskboard_perception/exceptions.hpp"

#include <opencv2/imgproc.hpp>

#include <string>

namespace taskboard {
namespace perception {
namespace geometry {

static Eigen::Vector2f rotate_quarter(const Eigen::Vector2f& axis)
{
  return { -axis.y(), axis.x() };
}

Eigen::Vector2f Rectangle::axisRotated(const int quarter_turns) const
{
  Eigen::Vector2f axis = axis_a;

  for (int i = 0; i < ((quarter_turns % 4) + 4) % 4; ++i) {
    axis = rotate_quarter(axis);
  }

  return axis;
}

Rectangle fit_min_area_rectangle(const std::vector<Eigen::Vector2f>& points, const float min_side_length)
{
  if (points.size() < 3) {
    throw DegenerateFitError(
      "Rectangle fit needs at least 3 points, got " + std::to_string(points.size()) + "."
    );
  }

  std::vector<cv::Point2f> cv_points;
  cv_points.reserve(points.size());

  for (const auto& point : points) {
    cv_points.emplace_back(point.x(), point.y());
  }

  const cv::RotatedRect rotated_rect = cv::minAreaRect(cv_points);

  // Don't rely on the angle convention of cv::RotatedRect, it differs between OpenCV versions. The corners are
  // ordered, so two consecutive edges give both sides.
  cv::Point2f corner[4];
  rotated_rect.points(corner);

  const Eigen::Vector2f edge_a(corner[1].x - corner[0].x, corner[1].y - corner[0].y);
  const Eigen::Vector2f edge_b(corner[2].x - corner[1].x, corner[2].y - corner[1].y);

  Rectangle rectangle;

  rectangle.center = Eigen::Vector2f(rotated_rect.center.x, rotated_rect.center.y);
  rectangle.length_a = edge_a.norm();
  rectangle.length_b = edge_b.norm();

  if (!(rectangle.length_a >= min_side_length) || !(rectangle.length_b >= min_side_length)) {
    throw DegenerateFitError(
      "Fitted rectangle is degenerated (" + std::to_string(rectangle.length_a) + " x "
      + std::to_string(rectangle.length_b) + " m)."
    );
  }

  rectangle.axis_a = edge_a / rectangle.length_a;
  rectangle.axis_b = rotate_quarter(rectangle.axis_a);

  return rectangle;
}

} // end namespace geometry
} // end namespace perception
} // end namespace taskboard
