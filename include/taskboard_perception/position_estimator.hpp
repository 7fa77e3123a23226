/**
 * Copyright EduArt Robotik GmbH 2024
 *
 * Author: Christian Wendt (christian.wendt@eduart-robotik.com)
 */
#pragma once

#include "taskboard_perception/point_cloud_cropper.hpp"

#include <Eigen/Core>

namespace taskboard {
namespace perception {

class PositionEstimator
{
public:
  using Parameter = PointCloudCropper::Parameter;

  struct Result {
    ObjectPositions positions;
    // Needed by the orientation estimation. Empty if the board wasn't found.
    PointCluster board_cluster;
    PointClusters clusters;
  };

  /**
   * \throw Throws an std::invalid_argument if the intrinsics are not valid. The estimator must not be used before
   *        camera info was received.
   */
  PositionEstimator(const CameraIntrinsics& intrinsics, const Parameter& parameter);

  Result estimate(const std::vector<BoundingBox>& bounding_boxes, const PointCluster& points) const;
  inline Result operator()(const DetectionFrame& frame) const { return estimate(frame.bounding_boxes, frame.points); }

  static Eigen::Vector3f centroid(const PointCluster& cluster);

  inline const CameraIntrinsics& intrinsics() const { return _cropper.intrinsics(); }

private:
  const PointCloudCropper _cropper;
};

} // end namespace perception
} // end namespace taskboard
