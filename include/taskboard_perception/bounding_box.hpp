/**
 * Copyright EduArt Robotik GmbH 2024
 *
 * Author: Christian Wendt (christian.wendt@eduart-robotik.com)
 */
#pragma once

#include <Eigen/Core>

#include <algorithm>
#include <string>

namespace taskboard {
namespace perception {

struct BoundingBox {
  // Bounds are inclusive:
  //
  // (xmin, ymin) ------ (xmax, ymin)   in image coordinates: --> u
  //      |                   |                               |
  // (xmin, ymax) ------ (xmax, ymax)                       v v
  //
  inline bool contains(const Eigen::Vector2f& pixel) const {
    return pixel.x() >= xmin && pixel.x() <= xmax && pixel.y() >= ymin && pixel.y() <= ymax;
  }
  inline bool intersects(const BoundingBox& other) const {
    return xmin <= other.xmax && other.xmin <= xmax && ymin <= other.ymax && other.ymin <= ymax;
  }
  inline void enclose(const BoundingBox& other) {
    xmin = std::min(xmin, other.xmin);
    xmax = std::max(xmax, other.xmax);
    ymin = std::min(ymin, other.ymin);
    ymax = std::max(ymax, other.ymax);
  }

  std::string label;
  int xmin = 0;
  int xmax = 0;
  int ymin = 0;
  int ymax = 0;
  float confidence = 0.0f;
};

} // end namespace perception
} // end namespace taskboard
