/**
 * Copyright EduArt Robotik GmbH 2024
 *
 * Author: Christian Wendt (christian.wendt@eduart-robotik.com)
 */
#pragma once

#include "taskboard_perception/pose_composer.hpp"

#include <geometry_msgs/msg/pose.hpp>
#include <geometry_msgs/msg/transform.hpp>

#include <Eigen/Core>

namespace taskboard {
namespace perception {

geometry_msgs::msg::Pose to_pose(const ObjectPose& object_pose);
geometry_msgs::msg::Transform to_transform(const ObjectPose& object_pose);

// Rotation part is normalized before it is converted into a quaternion.
geometry_msgs::msg::Transform to_transform(const Eigen::Matrix4f& transform);

} // end namespace perception
} // end namespace taskboard
