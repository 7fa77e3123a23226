/**
 * Copyright EduArt Robotik GmbH 2024
 *
 * Author: Christian Wendt (christian.wendt@eduart-robotik.com)
 */
#pragma once

#include "taskboard_perception/bounding_box.hpp"
#include "taskboard_perception/camera_intrinsics.hpp"
#include "taskboard_perception/point_cluster.hpp"

#include <string>
#include <vector>

namespace taskboard {
namespace perception {

/**
 * \brief Assigns point cloud points to detected objects by projecting each point into the image and testing it
 *        against the detection bounding boxes.
 */
class PointCloudCropper
{
public:
  struct Parameter {
    std::string board_label = "taskboard";
    float min_confidence = 0.0f;
    // Grows the board's box so it also covers every detection intersecting it.
    bool board_region_encloses_landmarks = true;
  };

  PointCloudCropper(const CameraIntrinsics& intrinsics, const Parameter& parameter);

  /**
   * \brief Crops one cluster per label out of the given points.
   * \param bounding_boxes Detections of the current cycle.
   * \param points Points in the camera optical frame. Non finite points are skipped.
   * \returns Label to cluster map. Labels without any point are not contained.
   */
  PointClusters crop(const std::vector<BoundingBox>& bounding_boxes, const PointCluster& points) const;
  inline PointClusters operator()(const std::vector<BoundingBox>& bounding_boxes, const PointCluster& points) const {
    return crop(bounding_boxes, points);
  }

  /**
   * \brief Keeps the most confident box per label, drops boxes below the confidence threshold and extends the
   *        board region if configured.
   */
  std::vector<BoundingBox> selectRegions(const std::vector<BoundingBox>& bounding_boxes) const;

  inline const CameraIntrinsics& intrinsics() const { return _intrinsics; }
  inline const Parameter& parameter() const { return _parameter; }

private:
  const CameraIntrinsics _intrinsics;
  const Parameter _parameter;
};

} // end namespace perception
} // end namespace taskboard
