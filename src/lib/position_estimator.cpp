#include "taskboard_perception/position_estimator.hpp"

#include <stdexcept>

namespace taskboard {
namespace perception {

PositionEstimator::PositionEstimator(const CameraIntrinsics& intrinsics, const Parameter& parameter)
  : _cropper(intrinsics, parameter)
{

}

PositionEstimator::Result PositionEstimator::estimate(
  const std::vector<BoundingBox>& bounding_boxes, const PointCluster& points) const
{
  Result result;
  result.clusters = _cropper(bounding_boxes, points);

  for (const auto& entry : result.clusters) {
    if (entry.second.empty()) {
      continue;
    }

    result.positions[entry.first] = centroid(entry.second);
  }

  const auto board = result.clusters.find(_cropper.parameter().board_label);

  if (board != result.clusters.end()) {
    result.board_cluster = board->second;
  }

  return result;
}

Eigen::Vector3f PositionEstimator::centroid(const PointCluster& cluster)
{
  if (cluster.empty()) {
    throw std::invalid_argument("PositionEstimator: centroid of an empty cluster is not defined.");
  }

  // Accumulate in double, clusters of a full board easily contain some 100k points.
  Eigen::Vector3d sum = Eigen::Vector3d::Zero();

  for (const auto& point : cluster) {
    sum += point.cast<double>();
  }

  return (sum / static_cast<double>(cluster.size())).cast<float>();
}

} // end namespace perception
} // end namespace taskboard
