#include "taskboard_perception/camera_intrinsics.hpp"

#include <stdexcept>

namespace taskboard {
namespace perception {

Eigen::Vector2f CameraIntrinsics::project(const Eigen::Vector3f& point) const
{
  if (!(point.z() > 0.0f)) {
    throw std::invalid_argument("CameraIntrinsics: can't project point that is not in front of the camera.");
  }

  return {
    fx * point.x() / point.z() + cx,
    fy * point.y() / point.z() + cy
  };
}

Eigen::Vector3f CameraIntrinsics::backProject(const Eigen::Vector2f& pixel, const float depth) const
{
  return {
    (pixel.x() - cx) * depth / fx,
    (pixel.y() - cy) * depth / fy,
    depth
  };
}

} // end namespace perception
} // end namespace taskboard
