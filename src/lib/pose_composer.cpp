#include "taskboard_perception/pose_composer.hpp"

#include <stdexcept>

namespace taskboard {
namespace perception {

Eigen::Quaternionf board_rotation(const OrientationEstimate& estimate)
{
  if (!estimate.isValid()) {
    throw std::invalid_argument("board_rotation: orientation estimation wasn't successful.");
  }

  const Eigen::Matrix3f rotation = estimate.transform.block<3, 3>(0, 0);
  // Matrix to quaternion conversion isn't exactly unit length due to numerical drift.
  return Eigen::Quaternionf(rotation).normalized();
}

ObjectPoses compose_object_poses(const ObjectPositions& positions, const OrientationEstimate& estimate)
{
  ObjectPoses poses;
  const bool has_orientation = estimate.isValid();
  const Eigen::Quaternionf orientation = has_orientation ? board_rotation(estimate) : Eigen::Quaternionf::Identity();

  for (const auto& entry : positions) {
    ObjectPose& pose = poses[entry.first];

    pose.position = entry.second;
    pose.orientation = orientation;
    pose.has_orientation = has_orientation;
  }

  return poses;
}

bool compose_board_frame(
  const ObjectPositions& positions, const OrientationEstimate& estimate, const std::string& board_label,
  ObjectPose& board_frame)
{
  const auto board = positions.find(board_label);

  if (!estimate.isValid() || board == positions.end()) {
    return false;
  }

  board_frame.position = board->second;
  board_frame.orientation = board_rotation(estimate);
  board_frame.has_orientation = true;

  return true;
}

} // end namespace perception
} // end namespace taskboard
