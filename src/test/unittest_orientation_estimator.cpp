#include <gtest/gtest.h>

#include <taskboard_perception/orientation_estimator.hpp>
#include <taskboard_perception/position_estimator.hpp>

#include "synthetic_taskboard.hpp"

#include <memory>
#include <set>
#include <stdexcept>
#include <string>

using taskboard::perception::OrientationEstimate;
using taskboard::perception::OrientationEstimator;
using taskboard::perception::PositionEstimator;
using taskboard::perception::PointCluster;
using taskboard::perception::ObjectPositions;
using taskboard::perception::geometry::Rectangle;
using taskboard::perception::orientation::AxisDisambiguation;
using taskboard::perception::orientation::LandmarkPositions2D;
namespace test = taskboard::perception::test;

namespace {

struct Observation {
  PointCluster board_cluster;
  ObjectPositions positions;
};

Observation observe(const test::SyntheticTaskboard& scene)
{
  const PositionEstimator estimator(scene.intrinsics, PositionEstimator::Parameter());
  const auto result = estimator(scene.frame);

  return { result.board_cluster, result.positions };
}

void expect_proper_rotation(const Eigen::Matrix4f& transform)
{
  const Eigen::Matrix3f rotation = transform.block<3, 3>(0, 0);

  EXPECT_TRUE((rotation.transpose() * rotation).isIdentity(1e-4f));
  EXPECT_NEAR(rotation.determinant(), 1.0f, 1e-4f);
}

// Reports a fixed result and remembers which landmarks it got.
class FixedDisambiguation : public AxisDisambiguation
{
public:
  FixedDisambiguation(const bool found, std::set<std::string>& seen_labels)
    : _found(found)
    , _seen_labels(seen_labels)
  { }

  Result resolve(const Rectangle& rectangle, const LandmarkPositions2D& landmarks) const override
  {
    for (const auto& landmark : landmarks) {
      _seen_labels.insert(landmark.first);
    }

    Result result;
    result.horizontal_side_found = _found;
    result.vertical_side_found = _found;
    result.x_axis = rectangle.axis_a;
    result.y_axis = rectangle.axis_b;

    return result;
  }

private:
  const bool _found;
  std::set<std::string>& _seen_labels;
};

// Stands in for a strategy that fails with an unexpected error.
class ThrowingDisambiguation : public AxisDisambiguation
{
public:
  Result resolve(const Rectangle&, const LandmarkPositions2D&) const override
  {
    throw std::runtime_error("layout lookup failed");
  }
};

} // end namespace

TEST(orientation_estimator, recovers_board_pose)
{
  const OrientationEstimator estimator{ OrientationEstimator::Parameter() };
  const float yaws[] = { 0.0f, 0.4f, 1.3f, -2.0f, 3.0f };

  for (const float yaw : yaws) {
    const auto scene = test::make_taskboard(
      test::facing_camera_rotation(yaw, 0.3f, -0.2f), Eigen::Vector3f(0.05f, -0.02f, 1.0f)
    );
    const auto observation = observe(scene);
    const OrientationEstimate estimate = estimator.estimate(observation.board_cluster, observation.positions);

    ASSERT_TRUE(estimate.isValid()) << "yaw = " << yaw << ": " << estimate.message;
    EXPECT_TRUE(estimate.orientation_estimation_success);
    EXPECT_TRUE(estimate.horizontal_side_found);
    EXPECT_TRUE(estimate.vertical_side_found);
    expect_proper_rotation(estimate.transform);

    const Eigen::Matrix3f rotation = estimate.transform.block<3, 3>(0, 0);
    EXPECT_LT(test::rotation_angle_between(rotation, scene.rotation), 2.0f * static_cast<float>(M_PI) / 180.0f)
      << "yaw = " << yaw;
    EXPECT_LT((estimate.transform.block<3, 1>(0, 3) - scene.translation).norm(), 0.005f);
  }
}

TEST(orientation_estimator, ignores_background_behind_yawed_board)
{
  const OrientationEstimator estimator{ OrientationEstimator::Parameter() };
  auto scene = test::make_taskboard(test::facing_camera_rotation(0.5f, 0.0f, 0.0f), Eigen::Vector3f(0.0f, 0.0f, 1.0f));
  const std::size_t board_points = scene.frame.points.size();

  test::add_background_wall(scene, 0.3f);
  ASSERT_GT(scene.frame.points.size(), board_points + 1000u);

  const auto observation = observe(scene);
  ASSERT_GT(observation.board_cluster.size(), board_points);

  const OrientationEstimate estimate = estimator.estimate(observation.board_cluster, observation.positions);

  ASSERT_TRUE(estimate.isValid()) << estimate.message;
  expect_proper_rotation(estimate.transform);

  const Eigen::Matrix3f rotation = estimate.transform.block<3, 3>(0, 0);
  EXPECT_LT(test::rotation_angle_between(rotation, scene.rotation), 2.0f * static_cast<float>(M_PI) / 180.0f);
  EXPECT_LT((estimate.transform.block<3, 1>(0, 3) - scene.translation).norm(), 0.005f);
}

TEST(orientation_estimator, normal_faces_camera)
{
  const OrientationEstimator estimator{ OrientationEstimator::Parameter() };
  const auto scene = test::make_taskboard(
    test::facing_camera_rotation(0.7f, -0.4f, 0.1f), Eigen::Vector3f(-0.1f, 0.05f, 0.8f)
  );
  const auto observation = observe(scene);
  const auto estimate = estimator.estimate(observation.board_cluster, observation.positions);

  ASSERT_TRUE(estimate.isValid()) << estimate.message;
  const Eigen::Vector3f normal = estimate.transform.block<3, 1>(0, 2);
  const Eigen::Vector3f centroid = estimate.transform.block<3, 1>(0, 3);
  EXPECT_LT(normal.dot(centroid), 0.0f);
}

TEST(orientation_estimator, empty_board_cluster)
{
  const OrientationEstimator estimator{ OrientationEstimator::Parameter() };
  const auto estimate = estimator.estimate(PointCluster(), ObjectPositions());

  EXPECT_EQ(estimate.status, OrientationEstimate::Status::BoardNotDetected);
  EXPECT_FALSE(estimate.orientation_estimation_success);
  EXPECT_FALSE(estimate.message.empty());
}

TEST(orientation_estimator, collinear_board_is_degenerate)
{
  const OrientationEstimator estimator{ OrientationEstimator::Parameter() };
  const auto frame = test::make_collinear_frame();
  OrientationEstimate estimate;

  ASSERT_NO_THROW(estimate = estimator.estimate(frame.points, ObjectPositions()));
  EXPECT_EQ(estimate.status, OrientationEstimate::Status::DegenerateFit);
  EXPECT_FALSE(estimate.orientation_estimation_success);
  EXPECT_FALSE(estimate.horizontal_side_found);
  EXPECT_FALSE(estimate.vertical_side_found);
}

TEST(orientation_estimator, too_few_board_points_is_degenerate)
{
  OrientationEstimator::Parameter parameter;
  parameter.min_board_points = 30;
  const OrientationEstimator estimator(parameter);
  const PointCluster cluster = {
    { 0.0f, 0.0f, 1.0f }, { 0.1f, 0.0f, 1.0f }, { 0.0f, 0.1f, 1.0f }, { 0.1f, 0.1f, 1.0f }
  };

  EXPECT_EQ(estimator.estimate(cluster, ObjectPositions()).status, OrientationEstimate::Status::DegenerateFit);
}

TEST(orientation_estimator, missing_landmarks_side_not_found)
{
  const OrientationEstimator estimator{ OrientationEstimator::Parameter() };
  const auto scene = test::make_taskboard(
    test::facing_camera_rotation(0.3f, 0.0f, 0.0f), Eigen::Vector3f(0.0f, 0.0f, 1.0f), {}
  );
  const auto observation = observe(scene);
  const auto estimate = estimator.estimate(observation.board_cluster, observation.positions);

  EXPECT_EQ(estimate.status, OrientationEstimate::Status::SideNotFound);
  EXPECT_FALSE(estimate.orientation_estimation_success);
  EXPECT_FALSE(estimate.horizontal_side_found);
  EXPECT_FALSE(estimate.vertical_side_found);
}

TEST(orientation_estimator, only_vertical_landmark_side_not_found)
{
  const OrientationEstimator estimator{ OrientationEstimator::Parameter() };
  const auto scene = test::make_taskboard(
    test::facing_camera_rotation(0.0f, 0.0f, 0.0f), Eigen::Vector3f(0.0f, 0.0f, 1.0f),
    { { "white_center", Eigen::Vector2f(0.0f, -0.04f) } }
  );
  const auto observation = observe(scene);
  const auto estimate = estimator.estimate(observation.board_cluster, observation.positions);

  EXPECT_EQ(estimate.status, OrientationEstimate::Status::SideNotFound);
  EXPECT_FALSE(estimate.horizontal_side_found);
  EXPECT_TRUE(estimate.vertical_side_found);
}

TEST(orientation_estimator, custom_disambiguation)
{
  const auto scene = test::make_taskboard(
    test::facing_camera_rotation(0.2f, 0.1f, 0.0f), Eigen::Vector3f(0.0f, 0.0f, 1.0f)
  );
  const auto observation = observe(scene);
  std::set<std::string> seen_labels;

  const OrientationEstimator accepting(
    OrientationEstimator::Parameter(), std::make_unique<FixedDisambiguation>(true, seen_labels)
  );
  const auto estimate = accepting.estimate(observation.board_cluster, observation.positions);

  ASSERT_TRUE(estimate.isValid()) << estimate.message;
  expect_proper_rotation(estimate.transform);
  EXPECT_EQ(seen_labels, (std::set<std::string>{ "red", "white_center" }));

  const OrientationEstimator rejecting(
    OrientationEstimator::Parameter(), std::make_unique<FixedDisambiguation>(false, seen_labels)
  );
  EXPECT_EQ(
    rejecting.estimate(observation.board_cluster, observation.positions).status,
    OrientationEstimate::Status::SideNotFound
  );
}

TEST(orientation_estimator, strategy_error_is_degenerate_fit)
{
  const OrientationEstimator estimator(
    OrientationEstimator::Parameter(), std::make_unique<ThrowingDisambiguation>()
  );
  const auto scene = test::make_taskboard(
    test::facing_camera_rotation(0.2f, 0.0f, 0.0f), Eigen::Vector3f(0.0f, 0.0f, 1.0f)
  );
  const auto observation = observe(scene);
  OrientationEstimate estimate;

  ASSERT_NO_THROW(estimate = estimator.estimate(observation.board_cluster, observation.positions));
  EXPECT_EQ(estimate.status, OrientationEstimate::Status::DegenerateFit);
  EXPECT_FALSE(estimate.orientation_estimation_success);
  EXPECT_NE(estimate.message.find("layout lookup failed"), std::string::npos);
}

TEST(orientation_estimator, null_disambiguation_throws)
{
  EXPECT_THROW(OrientationEstimator(OrientationEstimator::Parameter(), nullptr), std::invalid_argument);
}

TEST(orientation_estimator, status_names)
{
  EXPECT_STREQ(taskboard::perception::to_string(OrientationEstimate::Status::Success), "success");
  EXPECT_STREQ(taskboard::perception::to_string(OrientationEstimate::Status::SideNotFound), "side not found");
}
