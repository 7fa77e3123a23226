#include "taskboard_perception/point_cloud_cropper.hpp"

#include <cmath>
#include <map>
#include <stdexcept>

namespace taskboard {
namespace perception {

static bool is_valid_point(const Eigen::Vector3f& point)
{
  return std::isfinite(point.x()) && std::isfinite(point.y()) && std::isfinite(point.z()) && point.z() > 0.0f;
}

PointCloudCropper::PointCloudCropper(const CameraIntrinsics& intrinsics, const Parameter& parameter)
  : _intrinsics(intrinsics)
  , _parameter(parameter)
{
  if (!_intrinsics.isValid()) {
    throw std::invalid_argument("PointCloudCropper: camera intrinsics are not valid.");
  }
}

std::vector<BoundingBox> PointCloudCropper::selectRegions(const std::vector<BoundingBox>& bounding_boxes) const
{
  std::map<std::string, BoundingBox> best_box;

  for (const auto& box : bounding_boxes) {
    if (box.confidence < _parameter.min_confidence) {
      continue;
    }

    const auto search = best_box.find(box.label);

    if (search == best_box.end() || search->second.confidence < box.confidence) {
      best_box[box.label] = box;
    }
  }

  const auto board = best_box.find(_parameter.board_label);

  if (board != best_box.end() && _parameter.board_region_encloses_landmarks) {
    // Use the detected box only to decide what belongs to the board, the region itself can only grow.
    const BoundingBox detected_board = board->second;

    for (const auto& entry : best_box) {
      if (entry.first != _parameter.board_label && detected_board.intersects(entry.second)) {
        board->second.enclose(entry.second);
      }
    }
  }

  std::vector<BoundingBox> regions;
  regions.reserve(best_box.size());

  for (const auto& entry : best_box) {
    regions.push_back(entry.second);
  }

  return regions;
}

PointClusters PointCloudCropper::crop(
  const std::vector<BoundingBox>& bounding_boxes, const PointCluster& points) const
{
  const auto regions = selectRegions(bounding_boxes);
  PointClusters clusters;

  if (regions.empty()) {
    return clusters;
  }

  for (const auto& point : points) {
    if (!is_valid_point(point)) {
      continue;
    }

    const Eigen::Vector2f pixel = _intrinsics.project(point);

    // A point can be claimed by several overlapping boxes.
    for (const auto& region : regions) {
      if (region.contains(pixel)) {
        clusters[region.label].push_back(point);
      }
    }
  }

  return clusters;
}

} // end namespace perception
} // end namespace taskboard
