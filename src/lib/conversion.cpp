#include "taskboard_perception/ros/conversion.hpp"
#include "taskboard_perception/transform.hpp"

#include <sensor_msgs/point_cloud2_iterator.hpp>

#include <cmath>

namespace taskboard {
namespace perception {
namespace ros {

CameraIntrinsics to_camera_intrinsics(const sensor_msgs::msg::CameraInfo& camera_info)
{
  CameraIntrinsics intrinsics;

  intrinsics.fx = camera_info.k[0];
  intrinsics.fy = camera_info.k[4];
  intrinsics.cx = camera_info.k[2];
  intrinsics.cy = camera_info.k[5];

  return intrinsics;
}

PointCluster to_point_cluster(const sensor_msgs::msg::PointCloud2& point_cloud)
{
  // The iterators throw on a missing field.
  sensor_msgs::PointCloud2ConstIterator<float> iter_x(point_cloud, "x");
  sensor_msgs::PointCloud2ConstIterator<float> iter_y(point_cloud, "y");
  sensor_msgs::PointCloud2ConstIterator<float> iter_z(point_cloud, "z");

  const std::size_t size = static_cast<std::size_t>(point_cloud.width) * point_cloud.height;
  PointCluster points;
  points.reserve(size);

  for (std::size_t i = 0; i < size; ++i, ++iter_x, ++iter_y, ++iter_z) {
    if (!std::isfinite(*iter_x) || !std::isfinite(*iter_y) || !std::isfinite(*iter_z)) {
      continue;
    }

    points.emplace_back(*iter_x, *iter_y, *iter_z);
  }

  return points;
}

std::vector<BoundingBox> to_bounding_boxes(const taskboard_perception::msg::BoundingBoxList& bounding_box_list)
{
  std::vector<BoundingBox> bounding_boxes;
  bounding_boxes.reserve(bounding_box_list.bounding_boxes.size());

  for (const auto& box : bounding_box_list.bounding_boxes) {
    BoundingBox bounding_box;

    bounding_box.label = box.label;
    bounding_box.xmin = box.xmin;
    bounding_box.xmax = box.xmax;
    bounding_box.ymin = box.ymin;
    bounding_box.ymax = box.ymax;
    bounding_box.confidence = box.confidence;

    bounding_boxes.push_back(bounding_box);
  }

  return bounding_boxes;
}

taskboard_perception::msg::ObjectList to_object_list(
  const ObjectPositions& positions, const std_msgs::msg::Header& header)
{
  taskboard_perception::msg::ObjectList object_list;
  object_list.header = header;

  for (const auto& entry : positions) {
    ObjectPose pose;
    pose.position = entry.second;

    taskboard_perception::msg::Object object;
    object.label = entry.first;
    object.pose = to_pose(pose);
    object.has_orientation = false;
    object_list.objects.push_back(object);
  }

  return object_list;
}

taskboard_perception::msg::ObjectList to_object_list(const ObjectPoses& poses, const std_msgs::msg::Header& header)
{
  taskboard_perception::msg::ObjectList object_list;
  object_list.header = header;

  for (const auto& entry : poses) {
    taskboard_perception::msg::Object object;
    object.label = entry.first;
    object.pose = to_pose(entry.second);
    object.has_orientation = entry.second.has_orientation;
    object_list.objects.push_back(object);
  }

  return object_list;
}

} // end namespace ros
} // end namespace perception
} // end namespace taskboard
