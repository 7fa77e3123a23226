/**
 * Copyright EduArt Robotik GmbH 2024
 *
 * Author: Christian Wendt (christian.wendt@eduart-robotik.com)
 */
#pragma once

#include "taskboard_perception/orientation/axis_disambiguation.hpp"
#include "taskboard_perception/point_cluster.hpp"

#include <Eigen/Core>

#include <cstddef>
#include <memory>
#include <string>

namespace taskboard {
namespace perception {

struct OrientationEstimate {
  enum class Status {
    Success,
    BoardNotDetected,
    DegenerateFit,
    SideNotFound
  };

  inline bool isValid() const { return status == Status::Success; }

  Status status = Status::BoardNotDetected;
  bool orientation_estimation_success = false;
  bool vertical_side_found = false;
  bool horizontal_side_found = false;
  // Board pose in camera frame. Columns of the rotation are the board's x, y and z (normal) axes, the translation
  // is the centroid of the board surface. Only meaningful if the estimation was successful.
  Eigen::Matrix4f transform = Eigen::Matrix4f::Identity();
  std::string message;
};

const char* to_string(const OrientationEstimate::Status status);

/**
 * \brief Estimates the orientation of the (planar, rectangular) taskboard from its point cluster. The positions of
 *        other detected objects are used to resolve which rectangle side is which.
 */
class OrientationEstimator
{
public:
  struct Parameter {
    std::string board_label = "taskboard";
    std::size_t min_board_points = 30;
    // RANSAC plane segmentation run before the least squares plane fit.
    float plane_inlier_distance = 0.01f; // m
    int plane_max_iterations = 200;
    float min_planar_spread = 0.005f; // m
    float min_side_length = 0.02f;    // m
    orientation::LandmarkLayoutDisambiguation::Parameter landmark_layout;
  };

  /**
   * \brief Uses a LandmarkLayoutDisambiguation configured via parameter.
   */
  explicit OrientationEstimator(const Parameter& parameter);
  OrientationEstimator(const Parameter& parameter, std::unique_ptr<orientation::AxisDisambiguation> disambiguation);

  /**
   * \brief Runs a single estimation. Fitting errors are not thrown, they are reported via the returned status.
   * \param board_cluster All points belonging to the board.
   * \param positions Detected object positions. The board entry itself is ignored.
   */
  OrientationEstimate estimate(const PointCluster& board_cluster, const ObjectPositions& positions) const;
  inline OrientationEstimate operator()(const PointCluster& board_cluster, const ObjectPositions& positions) const {
    return estimate(board_cluster, positions);
  }

private:
  OrientationEstimate fit(const PointCluster& board_cluster, const ObjectPositions& positions) const;

  const Parameter _parameter;
  std::unique_ptr<orientation::AxisDisambiguation> _disambiguation;
};

} // end namespace perception
} // end namespace taskboard
