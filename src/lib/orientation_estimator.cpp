#include "taskboard_perception/orientation_estimator.hpp"
#include "taskboard_perception/exceptions.hpp"
#include "taskboard_perception/geometry/plane.hpp"
#include "taskboard_perception/geometry/rectangle.hpp"

#include <Eigen/Geometry>

#include <opencv2/core.hpp>

#include <stdexcept>
#include <string>

namespace taskboard {
namespace perception {

const char* to_string(const OrientationEstimate::Status status)
{
  switch (status) {
  case OrientationEstimate::Status::Success:
    return "success";
  case OrientationEstimate::Status::BoardNotDetected:
    return "board not detected";
  case OrientationEstimate::Status::DegenerateFit:
    return "degenerate fit";
  case OrientationEstimate::Status::SideNotFound:
    return "side not found";
  }

  return "unknown";
}

OrientationEstimator::OrientationEstimator(const Parameter& parameter)
  : OrientationEstimator(
      parameter, std::make_unique<orientation::LandmarkLayoutDisambiguation>(parameter.landmark_layout)
    )
{

}

OrientationEstimator::OrientationEstimator(
  const Parameter& parameter, std::unique_ptr<orientation::AxisDisambiguation> disambiguation)
  : _parameter(parameter)
  , _disambiguation(std::move(disambiguation))
{
  if (_disambiguation == nullptr) {
    throw std::invalid_argument("OrientationEstimator: an axis disambiguation strategy is required.");
  }
}

OrientationEstimate OrientationEstimator::estimate(
  const PointCluster& board_cluster, const ObjectPositions& positions) const
{
  if (board_cluster.empty()) {
    OrientationEstimate estimate;
    estimate.status = OrientationEstimate::Status::BoardNotDetected;
    estimate.message = "no points belong to '" + _parameter.board_label + "'";
    return estimate;
  }

  try {
    return fit(board_cluster, positions);
  }
  catch (const DegenerateFitError& ex) {
    OrientationEstimate estimate;
    estimate.status = OrientationEstimate::Status::DegenerateFit;
    estimate.message = ex.what();
    return estimate;
  }
  catch (const cv::Exception& ex) {
    OrientationEstimate estimate;
    estimate.status = OrientationEstimate::Status::DegenerateFit;
    estimate.message = std::string("OpenCV: ") + ex.what();
    return estimate;
  }
  catch (const std::exception& ex) {
    // e.g. thrown by an injected disambiguation strategy
    OrientationEstimate estimate;
    estimate.status = OrientationEstimate::Status::DegenerateFit;
    estimate.message = ex.what();
    return estimate;
  }
}

OrientationEstimate OrientationEstimator::fit(
  const PointCluster& board_cluster, const ObjectPositions& positions) const
{
  // 1. Plane and minimum area rectangle in plane coordinates. Only the board surface is used, background inside the
  //    board's bounding box is dropped by the segmentation.
  const PointCluster board_surface = geometry::segment_plane(
    board_cluster, _parameter.plane_inlier_distance, _parameter.plane_max_iterations
  );
  const geometry::Plane plane = geometry::fit_plane(
    board_surface, _parameter.min_board_points, _parameter.min_planar_spread
  );
  const geometry::Rectangle rectangle = geometry::fit_min_area_rectangle(
    geometry::project_on_plane(plane, board_surface), _parameter.min_side_length
  );

  // 2. Resolve the rectangle's symmetry using the other detected objects.
  orientation::LandmarkPositions2D landmarks;

  for (const auto& entry : positions) {
    if (entry.first != _parameter.board_label) {
      landmarks[entry.first] = plane.toPlane(entry.second);
    }
  }

  const auto sides = _disambiguation->resolve(rectangle, landmarks);

  OrientationEstimate estimate;
  estimate.horizontal_side_found = sides.horizontal_side_found;
  estimate.vertical_side_found = sides.vertical_side_found;

  if (!sides.horizontal_side_found || !sides.vertical_side_found) {
    estimate.status = OrientationEstimate::Status::SideNotFound;
    estimate.message = std::string("horizontal side ") + (sides.horizontal_side_found ? "found" : "not found")
      + ", vertical side " + (sides.vertical_side_found ? "found" : "not found");
    return estimate;
  }

  // 3. Right handed frame: x and y in plane, z is the plane normal facing the camera.
  const Eigen::Vector3f z_axis = plane.normal.normalized();
  const Eigen::Vector3f x_axis = plane.toSpace(sides.x_axis).normalized();
  const Eigen::Vector3f y_axis = z_axis.cross(x_axis).normalized();

  estimate.transform = Eigen::Matrix4f::Identity();
  estimate.transform.block<3, 1>(0, 0) = x_axis;
  estimate.transform.block<3, 1>(0, 1) = y_axis;
  estimate.transform.block<3, 1>(0, 2) = z_axis;
  estimate.transform.block<3, 1>(0, 3) = plane.centroid;

  estimate.status = OrientationEstimate::Status::Success;
  estimate.orientation_estimation_success = true;
  estimate.message = "board rectangle " + std::to_string(rectangle.length_a) + " x "
    + std::to_string(rectangle.length_b) + " m";

  return estimate;
}

} // end namespace perception
} // end namespace taskboard
