#include "taskboard_perception/ros/latest_input.hpp"

#include <utility>

namespace taskboard {
namespace perception {
namespace ros {

std::string LatestInput::Snapshot::missing() const
{
  std::string names;

  const auto append = [&names](const bool present, const char* name) {
    if (present) {
      return;
    }
    if (!names.empty()) {
      names += ", ";
    }
    names += name;
  };

  append(hasCameraInfo(), "camera_info");
  append(hasPointCloud(), "point_cloud");
  append(hasBoundingBoxes(), "bounding_boxes");

  return names;
}

bool LatestInput::updateCameraInfo(std::shared_ptr<const sensor_msgs::msg::CameraInfo> msg)
{
  std::lock_guard<std::mutex> lock(_mutex);
  const bool first = _latest.camera_info == nullptr;

  _latest.camera_info = std::move(msg);

  return first;
}

bool LatestInput::updatePointCloud(std::shared_ptr<const sensor_msgs::msg::PointCloud2> msg)
{
  std::lock_guard<std::mutex> lock(_mutex);
  const bool first = _latest.point_cloud == nullptr;

  _latest.point_cloud = std::move(msg);

  return first;
}

bool LatestInput::updateBoundingBoxes(std::shared_ptr<const taskboard_perception::msg::BoundingBoxList> msg)
{
  std::lock_guard<std::mutex> lock(_mutex);
  const bool first = _latest.bounding_boxes == nullptr;

  _latest.bounding_boxes = std::move(msg);
  _latest.new_bounding_boxes = true;

  return first;
}

LatestInput::Snapshot LatestInput::snapshot() const
{
  std::lock_guard<std::mutex> lock(_mutex);
  return _latest;
}

LatestInput::Snapshot LatestInput::consume()
{
  std::lock_guard<std::mutex> lock(_mutex);
  const Snapshot current = _latest;

  _latest.new_bounding_boxes = false;

  return current;
}

} // end namespace ros
} // end namespace perception
} // end namespace taskboard
