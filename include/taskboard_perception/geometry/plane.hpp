/**
 * Copyright EduArt Robotik GmbH 2024
 *
 * Author: Christian Wendt (christian.wendt@eduart-robotik.com)
 */
#pragma once

#include "taskboard_perception/point_cluster.hpp"

#include <Eigen/Core>

#include <cstddef>
#include <vector>

namespace taskboard {
namespace perception {
namespace geometry {

struct Plane {
  inline Eigen::Vector2f toPlane(const Eigen::Vector3f& point) const {
    const Eigen::Vector3f offset = point - centroid;
    return { offset.dot(axis_u), offset.dot(axis_v) };
  }
  inline Eigen::Vector3f toSpace(const Eigen::Vector2f& direction) const {
    return direction.x() * axis_u + direction.y() * axis_v;
  }

  Eigen::Vector3f centroid = Eigen::Vector3f::Zero();
  // Points towards the camera (origin of the point coordinates).
  Eigen::Vector3f normal = Eigen::Vector3f::UnitZ();
  // In plane axes, axis_u x axis_v == normal.
  Eigen::Vector3f axis_u = Eigen::Vector3f::UnitX();
  Eigen::Vector3f axis_v = Eigen::Vector3f::UnitY();
  // Standard deviation along axis_u and axis_v.
  Eigen::Vector2f spread = Eigen::Vector2f::Zero();
};

/**
 * \brief RANSAC plane segmentation. Keeps the points within distance_threshold of the dominant plane, so background
 *        showing through the corners of the board's bounding box doesn't reach the least squares fit.
 * \throw Throws a DegenerateFitError if no plane is found, e.g. for collinear points.
 */
PointCluster segment_plane(const PointCluster& cluster, const float distance_threshold, const int max_iterations);

/**
 * \brief Least squares plane fit using the eigen decomposition of the cluster's covariance.
 * \param min_points The cluster must contain at least this number of points.
 * \param min_spread Minimum standard deviation along both in plane axes. Guards against collinear sets.
 * \throw Throws a DegenerateFitError if the plane is not well defined by the given cluster.
 */
Plane fit_plane(const PointCluster& cluster, const std::size_t min_points, const float min_spread);

/**
 * \brief Projects the points into the plane's 2D coordinate system.
 */
std::vector<Eigen::Vector2f> project_on_plane(const Plane& plane, const PointCluster& cluster);

} // end namespace geometry
} // end namespace perception
} // end namespace taskboard
