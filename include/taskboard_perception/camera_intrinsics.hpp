/**
 * Copyright EduArt Robotik GmbH 2024
 *
 * Author: Christian Wendt (christian.wendt@eduart-robotik.com)
 */
#pragma once

#include <Eigen/Core>

namespace taskboard {
namespace perception {

/**
 * \brief Pinhole projection parameters of the depth aligned color camera.
 */
struct CameraIntrinsics {
  float fx = 0.0f;
  float fy = 0.0f;
  float cx = 0.0f;
  float cy = 0.0f;

  inline bool isValid() const { return fx > 0.0f && fy > 0.0f; }

  /**
   * \brief Projects a point given in the camera optical frame into pixel space.
   * \param point Point with z > 0.
   * \throw Throws an std::invalid_argument if the point is not in front of the camera.
   */
  Eigen::Vector2f project(const Eigen::Vector3f& point) const;
  /**
   * \brief Inverse of project() for a known depth (z coordinate).
   */
  Eigen::Vector3f backProject(const Eigen::Vector2f& pixel, const float depth) const;
};

} // end namespace perception
} // end namespace taskboard
