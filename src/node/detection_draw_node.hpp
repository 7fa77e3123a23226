/**
 * Copyright EduArt Robotik GmbH 2024
 *
 * Author: Christian Wendt (christian.wendt@eduart-robotik.com)
 */
#pragma once

#include <taskboard_perception/detection_drawing.hpp>

#include <taskboard_perception/msg/bounding_box_list.hpp>

#include <rclcpp/node.hpp>
#include <rclcpp/publisher.hpp>

#include <sensor_msgs/msg/image.hpp>
#include <message_filters/time_synchronizer.h>
#include <message_filters/subscriber.h>

#include <memory>
#include <string>

namespace taskboard {
namespace perception {

class DetectionDraw : public rclcpp::Node
{
public:
  struct Parameter {
    ClassColorMap class_colors;
  };

  static Parameter get_parameter(rclcpp::Node& ros_node, const Parameter& default_parameter);

  DetectionDraw();
  ~DetectionDraw() override;

private:
  void callbackSynchedDetection(
    std::shared_ptr<const sensor_msgs::msg::Image> image,
    std::shared_ptr<const taskboard_perception::msg::BoundingBoxList> detection);

  const Parameter _parameter;
  // Configured colors, extended by the random colors of unknown labels so each label keeps its color.
  ClassColorMap _class_colors;

  std::shared_ptr<rclcpp::Publisher<sensor_msgs::msg::Image>> _pub_image;

  // time synched subscriptions
  using Synchronizer = message_filters::TimeSynchronizer<
    sensor_msgs::msg::Image, taskboard_perception::msg::BoundingBoxList>;

  message_filters::Subscriber<sensor_msgs::msg::Image> _sub_image;
  message_filters::Subscriber<taskboard_perception::msg::BoundingBoxList> _sub_detection;
  std::shared_ptr<Synchronizer> _synchronizer;
};

} // end namespace perception
} // end namespace taskboard
