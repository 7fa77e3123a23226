/**
 * Copyright EduArt Robotik GmbH 2024
 *
 * Author: Christian Wendt (christian.wendt@eduart-robotik.com)
 */
#pragma once

#include <taskboard_perception/detection_drawing.hpp>
#include <taskboard_perception/ros/latest_input.hpp>
#include <taskboard_perception/taskboard_pose_estimation.hpp>

#include <taskboard_perception/msg/bounding_box_list.hpp>
#include <taskboard_perception/msg/object_list.hpp>

#include <rclcpp/node.hpp>
#include <rclcpp/publisher.hpp>
#include <rclcpp/subscription.hpp>

#include <sensor_msgs/msg/camera_info.hpp>
#include <sensor_msgs/msg/point_cloud2.hpp>
#include <visualization_msgs/msg/marker_array.hpp>

#include <tf2_ros/transform_broadcaster.h>

#include <cstddef>
#include <memory>
#include <string>

namespace taskboard {
namespace perception {

class TaskboardPoseEstimationNode : public rclcpp::Node
{
public:
  struct Parameter {
    TaskboardPoseEstimation::Parameter estimation;
    float retry_interval = 0.2f;     // s
    float processing_period = 0.05f; // s
    std::string frame_prefix = "";
    bool publish_object_frames = true;
    ClassColorMap class_colors;
  };

  static Parameter get_parameter(rclcpp::Node& ros_node, const Parameter& default_parameter);

  TaskboardPoseEstimationNode();
  ~TaskboardPoseEstimationNode() override;

private:
  void callbackCameraInfo(std::shared_ptr<const sensor_msgs::msg::CameraInfo> msg);
  void callbackPointCloud(std::shared_ptr<const sensor_msgs::msg::PointCloud2> msg);
  void callbackBoundingBoxes(std::shared_ptr<const taskboard_perception::msg::BoundingBoxList> msg);
  void callbackProcessing();

  DetectionFrame acquireFrame();
  cv::Scalar markerColor(const std::string& label);
  void publish(const TaskboardPoseEstimation::Result& result, const std_msgs::msg::Header& header);
  void publishMarkers(const TaskboardPoseEstimation::Result& result, const std_msgs::msg::Header& header);
  void broadcastFrames(const TaskboardPoseEstimation::Result& result, const std_msgs::msg::Header& header);

  const Parameter _parameter;

  ros::LatestInput _input;
  // Configured class colors plus the ones randomly assigned to unknown labels. Used by the processing callback only.
  ClassColorMap _marker_colors;
  // Rebuilt whenever the camera intrinsics change.
  std::unique_ptr<TaskboardPoseEstimation> _estimation;
  CameraIntrinsics _intrinsics;
  std_msgs::msg::Header _frame_header;

  std::shared_ptr<rclcpp::CallbackGroup> _callback_group_input;
  std::shared_ptr<rclcpp::CallbackGroup> _callback_group_processing;

  std::shared_ptr<rclcpp::Subscription<sensor_msgs::msg::CameraInfo>> _sub_camera_info;
  std::shared_ptr<rclcpp::Subscription<sensor_msgs::msg::PointCloud2>> _sub_point_cloud;
  std::shared_ptr<rclcpp::Subscription<taskboard_perception::msg::BoundingBoxList>> _sub_bounding_boxes;
  std::shared_ptr<rclcpp::Publisher<taskboard_perception::msg::ObjectList>> _pub_object_positions;
  std::shared_ptr<rclcpp::Publisher<taskboard_perception::msg::ObjectList>> _pub_object_poses;
  std::shared_ptr<rclcpp::Publisher<visualization_msgs::msg::MarkerArray>> _pub_markers;
  std::shared_ptr<rclcpp::TimerBase> _timer_processing;
  std::unique_ptr<tf2_ros::TransformBroadcaster> _tf_broadcaster;
};

} // end namespace perception
} // end namespace taskboard
