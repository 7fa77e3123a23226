/**
 * Copyright EduArt Robotik GmbH 2024
 *
 * Author: Christian Wendt (christian.wendt@eduart-robotik.com)
 */
#pragma once

#include <taskboard_perception/msg/bounding_box_list.hpp>

#include <sensor_msgs/msg/camera_info.hpp>
#include <sensor_msgs/msg/point_cloud2.hpp>

#include <memory>
#include <mutex>
#include <string>

namespace taskboard {
namespace perception {
namespace ros {

/**
 * \brief Holds the latest message per input. A new arrival replaces the previous one, nothing is queued. All methods
 *        are thread safe, readers always get a consistent copy of all slots.
 */
class LatestInput
{
public:
  struct Snapshot {
    inline bool hasCameraInfo() const { return camera_info != nullptr; }
    inline bool hasPointCloud() const { return point_cloud != nullptr; }
    inline bool hasBoundingBoxes() const { return bounding_boxes != nullptr; }
    inline bool isComplete() const { return hasCameraInfo() && hasPointCloud() && hasBoundingBoxes(); }
    // Comma separated names of the inputs not received yet. Empty if complete.
    std::string missing() const;

    std::shared_ptr<const sensor_msgs::msg::CameraInfo> camera_info;
    std::shared_ptr<const sensor_msgs::msg::PointCloud2> point_cloud;
    std::shared_ptr<const taskboard_perception::msg::BoundingBoxList> bounding_boxes;
    // True until the current bounding boxes were consumed.
    bool new_bounding_boxes = false;
  };

  // Each update returns true if it was the first message of its kind.
  bool updateCameraInfo(std::shared_ptr<const sensor_msgs::msg::CameraInfo> msg);
  bool updatePointCloud(std::shared_ptr<const sensor_msgs::msg::PointCloud2> msg);
  bool updateBoundingBoxes(std::shared_ptr<const taskboard_perception::msg::BoundingBoxList> msg);

  Snapshot snapshot() const;
  /**
   * \brief Like snapshot(), but marks the current bounding boxes as processed. Boxes arriving afterwards are new
   *        again.
   */
  Snapshot consume();

private:
  mutable std::mutex _mutex;
  Snapshot _latest;
};

} // end namespace ros
} // end namespace perception
} // end namespace taskboard
