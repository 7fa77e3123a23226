#include "taskboard_perception/geometry/plane.hpp"
#include "taskboard_perception/exceptions.hpp"

#include <Eigen/Eigenvalues>
#include <Eigen/Geometry>

#include <pcl/ModelCoefficients.h>
#include <pcl/PointIndices.h>
#include <pcl/point_cloud.h>
#include <pcl/point_types.h>
#include <pcl/sample_consensus/method_types.h>
#include <pcl/sample_consensus/model_types.h>
#include <pcl/segmentation/sac_segmentation.h>

#include <algorithm>
#include <cmath>
#include <string>

namespace taskboard {
namespace perception {
namespace geometry {

Plane fit_plane(const PointCluster& cluster, const std::size_t min_points, const float min_spread)
{
  if (cluster.size() < std::max<std::size_t>(min_points, 3)) {
    throw DegenerateFitError(
      "Plane fit needs at least " + std::to_string(std::max<std::size_t>(min_points, 3)) + " points, got "
      + std::to_string(cluster.size()) + "."
    );
  }

  Eigen::Vector3d centroid = Eigen::Vector3d::Zero();

  for (const auto& point : cluster) {
    centroid += point.cast<double>();
  }
  centroid /= static_cast<double>(cluster.size());

  Eigen::Matrix3d covariance = Eigen::Matrix3d::Zero();

  for (const auto& point : cluster) {
    const Eigen::Vector3d offset = point.cast<double>() - centroid;
    covariance += offset * offset.transpose();
  }
  covariance /= static_cast<double>(cluster.size());

  const Eigen::SelfAdjointEigenSolver<Eigen::Matrix3d> solver(covariance);

  if (solver.info() != Eigen::Success) {
    throw DegenerateFitError("Eigen decomposition of the cluster covariance failed.");
  }

  // Eigen values are sorted in increasing order.
  const Eigen::Vector3d eigen_values = solver.eigenvalues().cwiseMax(0.0);
  const Eigen::Vector2f spread(std::sqrt(eigen_values(2)), std::sqrt(eigen_values(1)));

  if (!(spread.y() >= min_spread)) {
    throw DegenerateFitError(
      "Cluster spans no plane (spread " + std::to_string(spread.x()) + " x " + std::to_string(spread.y())
      + " m), points are collinear or coincide."
    );
  }

  Plane plane;

  plane.centroid = centroid.cast<float>();
  plane.normal = solver.eigenvectors().col(0).cast<float>().normalized();
  plane.axis_u = solver.eigenvectors().col(2).cast<float>().normalized();
  plane.spread = spread;

  // The camera sits in the origin, the visible side of the board has to face it.
  if (plane.normal.dot(plane.centroid) > 0.0f) {
    plane.normal = -plane.normal;
  }

  plane.axis_v = plane.normal.cross(plane.axis_u).normalized();

  return plane;
}

std::vector<Eigen::Vector2f> project_on_plane(const Plane& plane, const PointCluster& cluster)
{
  std::vector<Eigen::Vector2f> projected;
  projected.reserve(cluster.size());

  for (const auto& point : cluster) {
    projected.push_back(plane.toPlane(point));
  }

  return projected;
}

PointCluster segment_plane(const PointCluster& cluster, const float distance_threshold, const int max_iterations)
{
  if (cluster.size() < 3) {
    throw DegenerateFitError(
      "Plane segmentation needs at least 3 points, got " + std::to_string(cluster.size()) + "."
    );
  }

  pcl::PointCloud<pcl::PointXYZ>::Ptr cloud(new pcl::PointCloud<pcl::PointXYZ>);
  cloud->reserve(cluster.size());

  for (const auto& point : cluster) {
    cloud->push_back(pcl::PointXYZ(point.x(), point.y(), point.z()));
  }

  pcl::ModelCoefficients::Ptr coefficients(new pcl::ModelCoefficients);
  pcl::PointIndices::Ptr inliers(new pcl::PointIndices);
  pcl::SACSegmentation<pcl::PointXYZ> seg;

  seg.setOptimizeCoefficients(true);
  seg.setModelType(pcl::SACMODEL_PLANE);
  seg.setMethodType(pcl::SAC_RANSAC);
  seg.setMaxIterations(max_iterations);
  seg.setDistanceThreshold(distance_threshold);
  seg.setInputCloud(cloud);
  seg.segment(*inliers, *coefficients);

  if (inliers->indices.empty()) {
    throw DegenerateFitError("RANSAC found no plane in a cluster of " + std::to_string(cluster.size()) + " points.");
  }

  PointCluster plane_points;
  plane_points.reserve(inliers->indices.size());

  for (const auto index : inliers->indices) {
    plane_points.push_back(cluster[index]);
  }

  return plane_points;
}

} // end namespace geometry
} // end namespace perception
} // end namespace taskboard
