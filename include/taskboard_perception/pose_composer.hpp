/**
 * Copyright EduArt Robotik GmbH 2024
 *
 * Author: Christian Wendt (christian.wendt@eduart-robotik.com)
 */
#pragma once

#include "taskboard_perception/orientation_estimator.hpp"
#include "taskboard_perception/point_cluster.hpp"

#include <Eigen/Geometry>

#include <map>
#include <string>

namespace taskboard {
namespace perception {

struct ObjectPose {
  Eigen::Vector3f position = Eigen::Vector3f::Zero();
  // Identity if has_orientation is false. Never use it without checking the flag.
  Eigen::Quaternionf orientation = Eigen::Quaternionf::Identity();
  bool has_orientation = false;
};

using ObjectPoses = std::map<std::string, ObjectPose>;

/**
 * \brief Returns the normalized board rotation of a successful estimate.
 * \throw Throws an std::invalid_argument if the estimate wasn't successful.
 */
Eigen::Quaternionf board_rotation(const OrientationEstimate& estimate);

/**
 * \brief All objects share the board's orientation, only their positions differ.
 */
ObjectPoses compose_object_poses(const ObjectPositions& positions, const OrientationEstimate& estimate);

/**
 * \brief Board frame with translation taken from the board's object position.
 * \returns False if orientation estimation failed or the board has no position. board_frame is untouched then.
 */
bool compose_board_frame(
  const ObjectPositions& positions, const OrientationEstimate& estimate, const std::string& board_label,
  ObjectPose& board_frame);

} // end namespace perception
} // end namespace taskboard
