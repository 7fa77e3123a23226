/**
 * Copyright EduArt Robotik GmbH 2024
 *
 * Author: Christian Wendt (christian.wendt@eduart-robotik.com)
 */
#pragma once

#include "taskboard_perception/orientation_estimator.hpp"
#include "taskboard_perception/pose_composer.hpp"
#include "taskboard_perception/position_estimator.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <string>

namespace taskboard {
namespace perception {

/**
 * \brief Complete estimation cycle: crop clusters, estimate positions, estimate the board orientation and compose
 *        the object poses. The orientation estimation is retried on fresh input data up to num_retries times.
 */
class TaskboardPoseEstimation
{
public:
  struct Parameter {
    int num_retries = 3;
    std::string board_label = "taskboard";
    PositionEstimator::Parameter position;
    OrientationEstimator::Parameter orientation;
  };

  struct Result {
    inline bool hasOrientation() const { return orientation.isValid(); }

    std::size_t attempts = 0;
    ObjectPositions positions;
    OrientationEstimate orientation;
    ObjectPoses poses;
  };

  // Has to deliver the most recent input each time it is called.
  using FrameSource = std::function<DetectionFrame()>;
  using AttemptCallback = std::function<void(const std::size_t attempt, const Result& result)>;

  TaskboardPoseEstimation(const CameraIntrinsics& intrinsics, const Parameter& parameter);
  TaskboardPoseEstimation(
    const CameraIntrinsics& intrinsics, const Parameter& parameter,
    std::unique_ptr<orientation::AxisDisambiguation> disambiguation);

  /**
   * \brief Runs up to num_retries attempts, each on a newly acquired frame, and stops at the first one with a valid
   *        orientation. If all attempts fail the result of the last one is returned (positions only).
   * \param acquire_frame Called once at the beginning of each attempt.
   * \param on_failed_attempt Optional, called after each attempt without valid orientation.
   */
  Result estimate(const FrameSource& acquire_frame, const AttemptCallback& on_failed_attempt = nullptr) const;
  Result estimateOnce(const DetectionFrame& frame) const;

  inline std::size_t numRetries() const { return _num_retries; }
  inline const std::string& boardLabel() const { return _board_label; }

private:
  const std::size_t _num_retries;
  const std::string _board_label;
  PositionEstimator _position_estimator;
  OrientationEstimator _orientation_estimator;
};

} // end namespace perception
} // end namespace taskboard
