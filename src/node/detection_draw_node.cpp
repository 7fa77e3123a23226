#include "detection_draw_node.hpp"

#include <taskboard_perception/ros/conversion.hpp>

#include <rclcpp/executors.hpp>
#include <rclcpp/logging.hpp>
#include <rclcpp/qos.hpp>

#include <cv_bridge/cv_bridge.h>

#include <functional>
#include <vector>

namespace taskboard {
namespace perception {

DetectionDraw::Parameter DetectionDraw::get_parameter(rclcpp::Node& ros_node, const Parameter& default_parameter)
{
  (void)default_parameter;
  Parameter parameter;

  ros_node.declare_parameter<std::vector<std::string>>("class_colors.labels", std::vector<std::string>{ });
  ros_node.declare_parameter<std::vector<double>>("class_colors.values", std::vector<double>{ });

  parameter.class_colors = make_class_color_map(
    ros_node.get_parameter("class_colors.labels").as_string_array(),
    ros_node.get_parameter("class_colors.values").as_double_array()
  );

  return parameter;
}

DetectionDraw::DetectionDraw()
  : rclcpp::Node("detection_draw")
  , _parameter(get_parameter(*this, Parameter()))
  , _class_colors(_parameter.class_colors)
{
  // subscriptions including time synchronizer
  const auto rmw_qos_profile = rclcpp::QoS(5).best_effort().get_rmw_qos_profile();
  _sub_image.subscribe(this, "image_raw", rmw_qos_profile);
  _sub_detection.subscribe(this, "bounding_boxes", rmw_qos_profile);

  _synchronizer = std::make_shared<Synchronizer>(_sub_image, _sub_detection, 10);
  _synchronizer->registerCallback(
    std::bind(&DetectionDraw::callbackSynchedDetection, this, std::placeholders::_1, std::placeholders::_2)
  );

  // publisher for drawn detections
  _pub_image = create_publisher<sensor_msgs::msg::Image>(
    "annotated_image", rclcpp::QoS(5).reliable()
  );

  RCLCPP_INFO(get_logger(), "drawing detections with %zu configured class colors", _parameter.class_colors.size());
}

DetectionDraw::~DetectionDraw()
{

}

void DetectionDraw::callbackSynchedDetection(
    std::shared_ptr<const sensor_msgs::msg::Image> image,
    std::shared_ptr<const taskboard_perception::msg::BoundingBoxList> detection)
{
  try {
    const auto bounding_boxes = ros::to_bounding_boxes(*detection);

    for (const auto& box : bounding_boxes) {
      bool assigned = false;
      assign_class_color(_class_colors, box.label, assigned);

      if (assigned) {
        RCLCPP_WARN(
          get_logger(), "class '%s' not found in class colors. Assigning a random color.", box.label.c_str());
      }
    }

    cv_bridge::CvImagePtr cv_image = cv_bridge::toCvCopy(image, "bgr8");
    cv_image->image = annotate_image(cv_image->image, bounding_boxes, _class_colors);

    _pub_image->publish(*cv_image->toImageMsg());
  }
  catch (cv_bridge::Exception& e) {
    RCLCPP_ERROR(this->get_logger(), "cv_bridge exception: %s", e.what());
    return;
  }
  catch (cv::Exception& e) {
    RCLCPP_ERROR(this->get_logger(), "OpenCV exception: %s", e.what());
    return;
  }
}

} // end namespace perception
} // end namespace taskboard

int main(int argc, char** argv)
{
  rclcpp::init(argc, argv);
  rclcpp::spin(std::make_shared<taskboard::perception::DetectionDraw>());
  rclcpp::shutdown();

  return 0;
}
