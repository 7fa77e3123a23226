#include "taskboard_perception/transform.hpp"

#include <Eigen/Geometry>

namespace taskboard {
namespace perception {

geometry_msgs::msg::Pose to_pose(const ObjectPose& object_pose)
{
  geometry_msgs::msg::Pose pose;

  pose.position.x = object_pose.position.x();
  pose.position.y = object_pose.position.y();
  pose.position.z = object_pose.position.z();
  pose.orientation.w = object_pose.orientation.w();
  pose.orientation.x = object_pose.orientation.x();
  pose.orientation.y = object_pose.orientation.y();
  pose.orientation.z = object_pose.orientation.z();

  return pose;
}

geometry_msgs::msg::Transform to_transform(const ObjectPose& object_pose)
{
  geometry_msgs::msg::Transform transform;

  transform.translation.x = object_pose.position.x();
  transform.translation.y = object_pose.position.y();
  transform.translation.z = object_pose.position.z();
  transform.rotation.w = object_pose.orientation.w();
  transform.rotation.x = object_pose.orientation.x();
  transform.rotation.y = object_pose.orientation.y();
  transform.rotation.z = object_pose.orientation.z();

  return transform;
}

geometry_msgs::msg::Transform to_transform(const Eigen::Matrix4f& transform)
{
  ObjectPose pose;

  pose.position = transform.block<3, 1>(0, 3);
  pose.orientation = Eigen::Quaternionf(Eigen::Matrix3f(transform.block<3, 3>(0, 0))).normalized();
  pose.has_orientation = true;

  return to_transform(pose);
}

} // end namespace perception
} // end namespace taskboard
