/**
 * Copyright EduArt Robotik GmbH 2024
 *
 * Author: Christian Wendt (christian.wendt@eduart-robotik.com)
 */
#pragma once

#include "taskboard_perception/bounding_box.hpp"

#include <Eigen/Core>

#include <map>
#include <string>
#include <vector>

namespace taskboard {
namespace perception {

using PointCluster = std::vector<Eigen::Vector3f>;
using PointClusters = std::map<std::string, PointCluster>;
using ObjectPositions = std::map<std::string, Eigen::Vector3f>;

/**
 * \brief Snapshot of everything one estimation attempt needs. Points are given in the camera optical frame.
 */
struct DetectionFrame {
  std::vector<BoundingBox> bounding_boxes;
  PointCluster points;
};

} // end namespace perception
} // end namespace taskboard
