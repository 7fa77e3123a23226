#include "taskboard_pose_estimation_node.hpp"

#include <taskboard_perception/detection_drawing.hpp>
#include <taskboard_perception/ros/conversion.hpp>
#include <taskboard_perception/ros/parameter.hpp>
#include <taskboard_perception/transform.hpp>

#include <geometry_msgs/msg/transform_stamped.hpp>

#include <rclcpp/executors.hpp>
#include <rclcpp/logging.hpp>
#include <rclcpp/qos.hpp>

#include <chrono>
#include <functional>
#include <stdexcept>
#include <thread>
#include <vector>

namespace taskboard {
namespace perception {

using namespace std::chrono_literals;

static std::vector<std::string> layout_labels(const orientation::LandmarkLayoutDisambiguation::Parameter& parameter)
{
  std::vector<std::string> labels;

  for (const auto& entry : parameter.layout) {
    labels.push_back(entry.first);
  }

  return labels;
}

static std::vector<double> layout_positions(const orientation::LandmarkLayoutDisambiguation::Parameter& parameter)
{
  std::vector<double> positions;

  for (const auto& entry : parameter.layout) {
    positions.push_back(entry.second.x());
    positions.push_back(entry.second.y());
  }

  return positions;
}

TaskboardPoseEstimationNode::Parameter TaskboardPoseEstimationNode::get_parameter(
  rclcpp::Node& ros_node, const Parameter& default_parameter)
{
  Parameter parameter;
  const auto& default_estimation = default_parameter.estimation;

  ros_node.declare_parameter<int>("num_retries", default_estimation.num_retries);
  ros_node.declare_parameter<float>("retry_interval", default_parameter.retry_interval);
  ros_node.declare_parameter<float>("processing_period", default_parameter.processing_period);
  ros_node.declare_parameter<std::string>("board_label", default_estimation.board_label);
  ros_node.declare_parameter<float>("min_confidence", default_estimation.position.min_confidence);
  ros_node.declare_parameter<bool>(
    "board_region_encloses_landmarks", default_estimation.position.board_region_encloses_landmarks);
  ros_node.declare_parameter<int>(
    "orientation.min_board_points", default_estimation.orientation.min_board_points);
  ros_node.declare_parameter<float>(
    "orientation.plane_inlier_distance", default_estimation.orientation.plane_inlier_distance);
  ros_node.declare_parameter<int>(
    "orientation.plane_max_iterations", default_estimation.orientation.plane_max_iterations);
  ros_node.declare_parameter<float>(
    "orientation.min_planar_spread", default_estimation.orientation.min_planar_spread);
  ros_node.declare_parameter<float>(
    "orientation.min_side_length", default_estimation.orientation.min_side_length);
  ros_node.declare_parameter<float>(
    "orientation.min_landmark_offset", default_estimation.orientation.landmark_layout.min_landmark_offset);
  ros_node.declare_parameter<std::vector<std::string>>(
    "landmark_layout.labels", layout_labels(default_estimation.orientation.landmark_layout));
  ros_node.declare_parameter<std::vector<double>>(
    "landmark_layout.positions", layout_positions(default_estimation.orientation.landmark_layout));
  ros_node.declare_parameter<std::vector<std::string>>("class_colors.labels", std::vector<std::string>{ });
  ros_node.declare_parameter<std::vector<double>>("class_colors.values", std::vector<double>{ });
  ros_node.declare_parameter<std::string>("frame_prefix", default_parameter.frame_prefix);
  ros_node.declare_parameter<bool>("publish_object_frames", default_parameter.publish_object_frames);

  parameter.estimation.num_retries = static_cast<int>(ros::as_count(ros_node.get_parameter("num_retries"), 1));
  parameter.retry_interval = ros_node.get_parameter("retry_interval").as_double();
  parameter.processing_period = ros_node.get_parameter("processing_period").as_double();
  parameter.estimation.board_label = ros_node.get_parameter("board_label").as_string();
  parameter.estimation.position.min_confidence = ros_node.get_parameter("min_confidence").as_double();
  parameter.estimation.position.board_region_encloses_landmarks = ros_node.get_parameter(
    "board_region_encloses_landmarks").as_bool();
  parameter.estimation.orientation.min_board_points = ros::as_count(
    ros_node.get_parameter("orientation.min_board_points"), 3);
  parameter.estimation.orientation.plane_inlier_distance = ros_node.get_parameter(
    "orientation.plane_inlier_distance").as_double();
  parameter.estimation.orientation.plane_max_iterations = static_cast<int>(ros::as_count(
    ros_node.get_parameter("orientation.plane_max_iterations"), 1));
  parameter.estimation.orientation.min_planar_spread = ros_node.get_parameter(
    "orientation.min_planar_spread").as_double();
  parameter.estimation.orientation.min_side_length = ros_node.get_parameter(
    "orientation.min_side_length").as_double();
  parameter.estimation.orientation.landmark_layout.min_landmark_offset = ros_node.get_parameter(
    "orientation.min_landmark_offset").as_double();
  parameter.frame_prefix = ros_node.get_parameter("frame_prefix").as_string();
  parameter.publish_object_frames = ros_node.get_parameter("publish_object_frames").as_bool();

  const auto labels = ros_node.get_parameter("landmark_layout.labels").as_string_array();
  const auto positions = ros_node.get_parameter("landmark_layout.positions").as_double_array();

  if (labels.size() * 2 != positions.size()) {
    throw std::invalid_argument(
      "TaskboardPoseEstimationNode: landmark_layout.positions must contain two values (x, y) per label!");
  }

  parameter.estimation.orientation.landmark_layout.layout.clear();

  for (std::size_t i = 0; i < labels.size(); ++i) {
    parameter.estimation.orientation.landmark_layout.layout[labels[i]] = Eigen::Vector2f(
      positions[i * 2 + 0], positions[i * 2 + 1]
    );
  }

  parameter.class_colors = make_class_color_map(
    ros_node.get_parameter("class_colors.labels").as_string_array(),
    ros_node.get_parameter("class_colors.values").as_double_array()
  );

  return parameter;
}

TaskboardPoseEstimationNode::TaskboardPoseEstimationNode()
  : rclcpp::Node("taskboard_pose_estimation")
  , _parameter(get_parameter(*this, Parameter()))
  , _marker_colors(_parameter.class_colors)
  , _tf_broadcaster(std::make_unique<tf2_ros::TransformBroadcaster>(this))
{
  // Incoming messages must be able to replace the latest input while an estimation is running.
  _callback_group_input = create_callback_group(rclcpp::CallbackGroupType::MutuallyExclusive);
  _callback_group_processing = create_callback_group(rclcpp::CallbackGroupType::MutuallyExclusive);

  rclcpp::SubscriptionOptions input_options;
  input_options.callback_group = _callback_group_input;

  // bring up ROS communication
  _sub_camera_info = create_subscription<sensor_msgs::msg::CameraInfo>(
    "camera_info",
    rclcpp::QoS(2).reliable(),
    std::bind(&TaskboardPoseEstimationNode::callbackCameraInfo, this, std::placeholders::_1),
    input_options
  );
  _sub_point_cloud = create_subscription<sensor_msgs::msg::PointCloud2>(
    "points",
    rclcpp::SensorDataQoS(),
    std::bind(&TaskboardPoseEstimationNode::callbackPointCloud, this, std::placeholders::_1),
    input_options
  );
  _sub_bounding_boxes = create_subscription<taskboard_perception::msg::BoundingBoxList>(
    "bounding_boxes",
    rclcpp::QoS(5).reliable(),
    std::bind(&TaskboardPoseEstimationNode::callbackBoundingBoxes, this, std::placeholders::_1),
    input_options
  );

  _pub_object_positions = create_publisher<taskboard_perception::msg::ObjectList>(
    "object_positions", rclcpp::QoS(10).reliable()
  );
  _pub_object_poses = create_publisher<taskboard_perception::msg::ObjectList>(
    "object_poses", rclcpp::QoS(10).reliable()
  );
  _pub_markers = create_publisher<visualization_msgs::msg::MarkerArray>(
    "markers", rclcpp::QoS(2).reliable()
  );

  _timer_processing = create_wall_timer(
    std::chrono::duration<float>(_parameter.processing_period),
    std::bind(&TaskboardPoseEstimationNode::callbackProcessing, this),
    _callback_group_processing
  );

  RCLCPP_INFO(
    get_logger(), "taskboard pose estimation started: board label = '%s', num retries = %d",
    _parameter.estimation.board_label.c_str(), _parameter.estimation.num_retries
  );
}

TaskboardPoseEstimationNode::~TaskboardPoseEstimationNode()
{

}

void TaskboardPoseEstimationNode::callbackCameraInfo(std::shared_ptr<const sensor_msgs::msg::CameraInfo> msg)
{
  if (_input.updateCameraInfo(msg)) {
    RCLCPP_INFO(
      get_logger(), "first camera info retrieved: fx = %.1f, fy = %.1f, cx = %.1f, cy = %.1f",
      msg->k[0], msg->k[4], msg->k[2], msg->k[5]
    );
  }
}

void TaskboardPoseEstimationNode::callbackPointCloud(std::shared_ptr<const sensor_msgs::msg::PointCloud2> msg)
{
  if (_input.updatePointCloud(msg)) {
    RCLCPP_INFO(get_logger(), "first point cloud retrieved: %ux%u points", msg->width, msg->height);
  }
}

void TaskboardPoseEstimationNode::callbackBoundingBoxes(
  std::shared_ptr<const taskboard_perception::msg::BoundingBoxList> msg)
{
  RCLCPP_DEBUG(get_logger(), "received %zu bounding boxes", msg->bounding_boxes.size());
  _input.updateBoundingBoxes(msg);
}

DetectionFrame TaskboardPoseEstimationNode::acquireFrame()
{
  // A detection batch arriving during the retries is consumed by them.
  const ros::LatestInput::Snapshot input = _input.consume();
  DetectionFrame frame;

  frame.bounding_boxes = ros::to_bounding_boxes(*input.bounding_boxes);
  frame.points = ros::to_point_cluster(*input.point_cloud);
  _frame_header = input.point_cloud->header;

  RCLCPP_DEBUG(
    get_logger(), "acquired frame: %zu bounding boxes, %zu valid points",
    frame.bounding_boxes.size(), frame.points.size()
  );

  return frame;
}

cv::Scalar TaskboardPoseEstimationNode::markerColor(const std::string& label)
{
  bool assigned = false;
  const cv::Scalar color = assign_class_color(_marker_colors, label, assigned);

  if (assigned) {
    RCLCPP_WARN(get_logger(), "class '%s' not found in class colors. Assigning a random color.", label.c_str());
  }

  return color;
}

void TaskboardPoseEstimationNode::callbackProcessing()
{
  try {
    const ros::LatestInput::Snapshot input = _input.snapshot();

    if (!input.new_bounding_boxes) {
      return;
    }
    if (!input.isComplete()) {
      RCLCPP_WARN_THROTTLE(
        get_logger(), *get_clock(), 3000, "missing data: %s. Waiting...", input.missing().c_str()
      );
      return;
    }

    const CameraIntrinsics intrinsics = ros::to_camera_intrinsics(*input.camera_info);

    if (!intrinsics.isValid()) {
      RCLCPP_WARN_THROTTLE(get_logger(), *get_clock(), 3000, "camera info contains no valid intrinsics.");
      return;
    }
    if (_estimation == nullptr || intrinsics.fx != _intrinsics.fx || intrinsics.fy != _intrinsics.fy
        || intrinsics.cx != _intrinsics.cx || intrinsics.cy != _intrinsics.cy) {
      _estimation = std::make_unique<TaskboardPoseEstimation>(intrinsics, _parameter.estimation);
      _intrinsics = intrinsics;
    }

    bool first_attempt = true;
    const auto result = _estimation->estimate(
      [this, &first_attempt]() {
        // Give the camera the chance to deliver a newer cloud before trying again.
        if (!first_attempt) {
          std::this_thread::sleep_for(std::chrono::duration<float>(_parameter.retry_interval));
        }
        first_attempt = false;
        return acquireFrame();
      },
      [this](const std::size_t attempt, const TaskboardPoseEstimation::Result& failed) {
        RCLCPP_WARN(
          get_logger(), "orientation estimation attempt %zu/%zu failed (%s): %s", attempt,
          _estimation->numRetries(), to_string(failed.orientation.status), failed.orientation.message.c_str()
        );
      }
    );

    if (result.hasOrientation()) {
      RCLCPP_INFO(
        get_logger(), "estimated pose of %zu objects after %zu attempt(s)", result.poses.size(), result.attempts
      );
    }
    else {
      RCLCPP_ERROR(
        get_logger(), "orientation estimation failed after %zu attempts, publishing %zu positions only",
        result.attempts, result.positions.size()
      );
    }

    publish(result, _frame_header);
  }
  catch (const std::exception& ex) {
    RCLCPP_ERROR(get_logger(), "exception thrown during pose estimation. what = %s", ex.what());
  }
}

void TaskboardPoseEstimationNode::publish(
  const TaskboardPoseEstimation::Result& result, const std_msgs::msg::Header& header)
{
  _pub_object_positions->publish(ros::to_object_list(result.positions, header));
  _pub_object_poses->publish(ros::to_object_list(result.poses, header));

  if (_pub_markers->get_subscription_count() > 0) {
    publishMarkers(result, header);
  }
  if (result.hasOrientation()) {
    broadcastFrames(result, header);
  }
}

void TaskboardPoseEstimationNode::publishMarkers(
  const TaskboardPoseEstimation::Result& result, const std_msgs::msg::Header& header)
{
  visualization_msgs::msg::MarkerArray marker_array;
  // ids are only unique within one publish cycle, old markers are removed first
  int marker_id = 0;

  visualization_msgs::msg::Marker delete_all;
  delete_all.header = header;
  delete_all.action = visualization_msgs::msg::Marker::DELETEALL;
  marker_array.markers.push_back(delete_all);

  for (const auto& entry : result.poses) {
    const cv::Scalar rgb = markerColor(entry.first);

    visualization_msgs::msg::Marker sphere;
    sphere.header = header;
    sphere.ns = "objects";
    sphere.id = marker_id++;
    sphere.type = visualization_msgs::msg::Marker::SPHERE;
    sphere.action = visualization_msgs::msg::Marker::ADD;
    sphere.pose = to_pose(entry.second);
    sphere.scale.x = sphere.scale.y = sphere.scale.z = 0.02;
    sphere.color.r = rgb[0] / 255.0;
    sphere.color.g = rgb[1] / 255.0;
    sphere.color.b = rgb[2] / 255.0;
    sphere.color.a = 1.0;
    marker_array.markers.push_back(sphere);

    visualization_msgs::msg::Marker text = sphere;
    text.ns = "labels";
    text.id = marker_id++;
    text.type = visualization_msgs::msg::Marker::TEXT_VIEW_FACING;
    text.text = entry.first;
    text.pose.position.y -= 0.03; // above the object, camera y axis points down
    text.pose.orientation.w = 1.0;
    text.pose.orientation.x = text.pose.orientation.y = text.pose.orientation.z = 0.0;
    text.scale.x = text.scale.y = 0.0;
    text.scale.z = 0.02;
    text.color.r = text.color.g = text.color.b = 1.0;
    marker_array.markers.push_back(text);
  }

  ObjectPose board_frame;

  if (compose_board_frame(result.positions, result.orientation, _estimation->boardLabel(), board_frame)) {
    const Eigen::Matrix3f rotation = board_frame.orientation.toRotationMatrix();

    for (int axis = 0; axis < 3; ++axis) {
      visualization_msgs::msg::Marker arrow;
      arrow.header = header;
      arrow.ns = "board_axes";
      arrow.id = marker_id++;
      arrow.type = visualization_msgs::msg::Marker::ARROW;
      arrow.action = visualization_msgs::msg::Marker::ADD;
      arrow.pose.orientation.w = 1.0;

      geometry_msgs::msg::Point start, end;
      start.x = board_frame.position.x();
      start.y = board_frame.position.y();
      start.z = board_frame.position.z();
      end.x = start.x + 0.1 * rotation(0, axis);
      end.y = start.y + 0.1 * rotation(1, axis);
      end.z = start.z + 0.1 * rotation(2, axis);
      arrow.points = { start, end };

      arrow.scale.x = 0.005;
      arrow.scale.y = 0.01;
      arrow.color.r = axis == 0 ? 1.0 : 0.0;
      arrow.color.g = axis == 1 ? 1.0 : 0.0;
      arrow.color.b = axis == 2 ? 1.0 : 0.0;
      arrow.color.a = 1.0;
      marker_array.markers.push_back(arrow);
    }
  }

  _pub_markers->publish(marker_array);
}

void TaskboardPoseEstimationNode::broadcastFrames(
  const TaskboardPoseEstimation::Result& result, const std_msgs::msg::Header& header)
{
  const std::string& board_label = _estimation->boardLabel();
  std::vector<geometry_msgs::msg::TransformStamped> transforms;
  ObjectPose board_frame;

  if (!compose_board_frame(result.positions, result.orientation, board_label, board_frame)) {
    return;
  }

  geometry_msgs::msg::TransformStamped board_transform;
  board_transform.header = header;
  board_transform.child_frame_id = _parameter.frame_prefix + board_label;
  board_transform.transform = to_transform(board_frame);
  transforms.push_back(board_transform);

  if (_parameter.publish_object_frames) {
    for (const auto& entry : result.poses) {
      if (entry.first == board_label || !entry.second.has_orientation) {
        continue;
      }

      geometry_msgs::msg::TransformStamped object_transform;
      object_transform.header = header;
      object_transform.child_frame_id = _parameter.frame_prefix + entry.first;
      object_transform.transform = to_transform(entry.second);
      transforms.push_back(object_transform);
    }
  }

  _tf_broadcaster->sendTransform(transforms);
}

} // end namespace perception
} // end namespace taskboard

int main(int argc, char** argv)
{
  rclcpp::init(argc, argv);

  // The input subscriptions have to run beside the (blocking) processing callback.
  rclcpp::executors::MultiThreadedExecutor executor(rclcpp::ExecutorOptions(), 2);
  auto node = std::make_shared<taskboard::perception::TaskboardPoseEstimationNode>();

  executor.add_node(node);
  executor.spin();
  rclcpp::shutdown();

  return 0;
}
