#include "taskboard_perception/taskboard_pose_estimation.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace taskboard {
namespace perception {

static PositionEstimator::Parameter with_board_label(PositionEstimator::Parameter parameter, const std::string& label)
{
  parameter.board_label = label;
  return parameter;
}

static OrientationEstimator::Parameter with_board_label(
  OrientationEstimator::Parameter parameter, const std::string& label)
{
  parameter.board_label = label;
  return parameter;
}

TaskboardPoseEstimation::TaskboardPoseEstimation(const CameraIntrinsics& intrinsics, const Parameter& parameter)
  : TaskboardPoseEstimation(
      intrinsics, parameter,
      std::make_unique<orientation::LandmarkLayoutDisambiguation>(parameter.orientation.landmark_layout)
    )
{

}

TaskboardPoseEstimation::TaskboardPoseEstimation(
  const CameraIntrinsics& intrinsics, const Parameter& parameter,
  std::unique_ptr<orientation::AxisDisambiguation> disambiguation)
  : _num_retries(static_cast<std::size_t>(std::max(parameter.num_retries, 1)))
  , _board_label(parameter.board_label)
  , _position_estimator(intrinsics, with_board_label(parameter.position, parameter.board_label))
  , _orientation_estimator(with_board_label(parameter.orientation, parameter.board_label), std::move(disambiguation))
{

}

TaskboardPoseEstimation::Result TaskboardPoseEstimation::estimate(
  const FrameSource& acquire_frame, const AttemptCallback& on_failed_attempt) const
{
  if (!acquire_frame) {
    throw std::invalid_argument("TaskboardPoseEstimation: no frame source given.");
  }

  Result result;

  for (std::size_t attempt = 1; attempt <= _num_retries; ++attempt) {
    result = estimateOnce(acquire_frame());
    result.attempts = attempt;

    if (result.hasOrientation()) {
      break;
    }
    if (on_failed_attempt) {
      on_failed_attempt(attempt, result);
    }
  }

  return result;
}

TaskboardPoseEstimation::Result TaskboardPoseEstimation::estimateOnce(const DetectionFrame& frame) const
{
  Result result;
  const auto positions = _position_estimator(frame);

  result.attempts = 1;
  result.positions = positions.positions;
  result.orientation = _orientation_estimator(positions.board_cluster, positions.positions);
  result.poses = compose_object_poses(result.positions, result.orientation);

  return result;
}

} // end namespace perception
} // end namespace taskboard
