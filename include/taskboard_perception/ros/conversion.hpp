/**
 * Copyright EduArt Robotik GmbH 2024
 *
 * Author: Christian Wendt (christian.wendt@eduart-robotik.com)
 */
#pragma once

#include "taskboard_perception/bounding_box.hpp"
#include "taskboard_perception/camera_intrinsics.hpp"
#include "taskboard_perception/point_cluster.hpp"
#include "taskboard_perception/pose_composer.hpp"

#include <taskboard_perception/msg/bounding_box_list.hpp>
#include <taskboard_perception/msg/object_list.hpp>

#include <sensor_msgs/msg/camera_info.hpp>
#include <sensor_msgs/msg/point_cloud2.hpp>
#include <std_msgs/msg/header.hpp>

#include <vector>

namespace taskboard {
namespace perception {
namespace ros {

CameraIntrinsics to_camera_intrinsics(const sensor_msgs::msg::CameraInfo& camera_info);

/**
 * \brief Extracts the x, y and z fields of the cloud. Invalid (NaN) points are dropped.
 * \throw Throws an std::runtime_error if the cloud has no x, y or z field.
 */
PointCluster to_point_cluster(const sensor_msgs::msg::PointCloud2& point_cloud);

std::vector<BoundingBox> to_bounding_boxes(const taskboard_perception::msg::BoundingBoxList& bounding_box_list);

taskboard_perception::msg::ObjectList to_object_list(
  const ObjectPositions& positions, const std_msgs::msg::Header& header);
taskboard_perception::msg::ObjectList to_object_list(const ObjectPoses& poses, const std_msgs::msg::Header& header);

} // end namespace ros
} // end namespace perception
} // end namespace taskboard
