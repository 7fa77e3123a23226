#include <gtest/gtest.h>

#include "synthetic_taskboard.hpp"

#include <taskboard_perception/exceptions.hpp>
#include <taskboard_perception/geometry/plane.hpp>
#include <taskboard_perception/geometry/rectangle.hpp>

#include <cmath>
#include <vector>

using taskboard::perception::DegenerateFitError;
using taskboard::perception::PointCluster;
using namespace taskboard::perception::geometry;

TEST(geometry, plane_normal_of_tilted_board_faces_camera)
{
  const Eigen::Matrix3f rotation = taskboard::perception::test::facing_camera_rotation(0.4f, 0.3f, -0.2f);
  const Eigen::Vector3f translation(0.1f, 0.05f, 1.2f);
  PointCluster cluster;

  for (int i = 0; i <= 20; ++i) {
    for (int j = 0; j <= 10; ++j) {
      cluster.push_back(rotation * Eigen::Vector3f(-0.2f + 0.02f * i, -0.1f + 0.02f * j, 0.0f) + translation);
    }
  }

  const Plane plane = fit_plane(cluster, 30, 0.005f);
  const Eigen::Vector3f expected_normal = rotation.col(2);

  EXPECT_NEAR(plane.normal.dot(expected_normal), 1.0f, 1e-4f);
  EXPECT_LT(plane.normal.dot(plane.centroid), 0.0f);
  EXPECT_TRUE(plane.centroid.isApprox(translation, 1e-4f));
  EXPECT_NEAR(plane.axis_u.cross(plane.axis_v).dot(plane.normal), 1.0f, 1e-4f);
  // Longer side of the grid is the board's x axis.
  EXPECT_NEAR(std::abs(plane.axis_u.dot(rotation.col(0))), 1.0f, 1e-3f);

  for (const auto& projected : project_on_plane(plane, cluster)) {
    EXPECT_LE(std::abs(projected.x()), 0.2f + 1e-4f);
    EXPECT_LE(std::abs(projected.y()), 0.2f + 1e-4f);
  }
}

TEST(geometry, plane_fit_rejects_degenerate_clusters)
{
  PointCluster line;

  for (int i = 0; i < 50; ++i) {
    line.emplace_back(0.01f * i, 0.02f * i, 1.0f + 0.005f * i);
  }

  EXPECT_THROW(fit_plane(line, 30, 0.005f), DegenerateFitError);
  EXPECT_THROW(fit_plane(PointCluster(40, Eigen::Vector3f(0.0f, 0.0f, 1.0f)), 30, 0.005f), DegenerateFitError);
  EXPECT_THROW(fit_plane({ Eigen::Vector3f(0.0f, 0.0f, 1.0f) }, 1, 0.005f), DegenerateFitError);
  EXPECT_THROW(fit_plane(PointCluster(), 0, 0.0f), DegenerateFitError);
}

TEST(geometry, plane_fit_requires_min_points)
{
  const PointCluster cluster = {
    { 0.0f, 0.0f, 1.0f }, { 0.1f, 0.0f, 1.0f }, { 0.0f, 0.1f, 1.0f }, { 0.1f, 0.1f, 1.0f }
  };

  EXPECT_NO_THROW(fit_plane(cluster, 4, 0.01f));
  EXPECT_THROW(fit_plane(cluster, 5, 0.01f), DegenerateFitError);
}

TEST(geometry, plane_segmentation_drops_background)
{
  namespace test = taskboard::perception::test;
  auto scene = test::make_taskboard(test::facing_camera_rotation(0.5f, 0.0f, 0.0f), Eigen::Vector3f(0.0f, 0.0f, 1.0f));
  const std::size_t board_points = scene.frame.points.size();

  test::add_background_wall(scene, 0.3f);
  ASSERT_GT(scene.frame.points.size(), board_points);

  const PointCluster surface = segment_plane(scene.frame.points, 0.01f, 200);

  EXPECT_EQ(surface.size(), board_points);

  for (const auto& point : surface) {
    EXPECT_NEAR(point.z(), 1.0f, 1e-3f);
  }
}

TEST(geometry, plane_segmentation_rejects_degenerate_clusters)
{
  PointCluster line;

  for (int i = 0; i < 50; ++i) {
    line.emplace_back(0.01f * i, 0.02f * i, 1.0f + 0.005f * i);
  }

  EXPECT_THROW(segment_plane(line, 0.01f, 200), DegenerateFitError);
  EXPECT_THROW(segment_plane({ Eigen::Vector3f(0.0f, 0.0f, 1.0f), Eigen::Vector3f(0.1f, 0.0f, 1.0f) }, 0.01f, 200),
               DegenerateFitError);
}

TEST(geometry, min_area_rectangle_of_rotated_grid)
{
  const float angle = 0.3f;
  const Eigen::Rotation2Df rotation(angle);
  const Eigen::Vector2f center(0.02f, -0.01f);
  std::vector<Eigen::Vector2f> points;

  for (int i = 0; i <= 30; ++i) {
    for (int j = 0; j <= 10; ++j) {
      points.push_back(rotation * Eigen::Vector2f(-0.15f + 0.01f * i, -0.05f + 0.01f * j) + center);
    }
  }

  const Rectangle rectangle = fit_min_area_rectangle(points, 0.02f);

  EXPECT_TRUE(rectangle.center.isApprox(center, 1e-3f));
  EXPECT_NEAR(rectangle.axis_a.norm(), 1.0f, 1e-5f);
  EXPECT_NEAR(rectangle.axis_a.dot(rectangle.axis_b), 0.0f, 1e-5f);
  // axis_b is axis_a turned counter clockwise
  EXPECT_NEAR(rectangle.axis_a.x() * rectangle.axis_b.y() - rectangle.axis_a.y() * rectangle.axis_b.x(), 1.0f, 1e-5f);

  // One of the axes is aligned to the long side.
  const Eigen::Vector2f long_side = rotation * Eigen::Vector2f::UnitX();
  const bool a_is_long = std::abs(rectangle.axis_a.dot(long_side)) > 0.5f;
  const float long_length = a_is_long ? rectangle.length_a : rectangle.length_b;
  const float short_length = a_is_long ? rectangle.length_b : rectangle.length_a;
  const Eigen::Vector2f long_axis = a_is_long ? rectangle.axis_a : rectangle.axis_b;

  EXPECT_NEAR(std::abs(long_axis.dot(long_side)), 1.0f, 1e-4f);
  EXPECT_NEAR(long_length, 0.3f, 1e-3f);
  EXPECT_NEAR(short_length, 0.1f, 1e-3f);

  for (int quarter_turns = 0; quarter_turns < 4; ++quarter_turns) {
    EXPECT_TRUE(rectangle.axisRotated(quarter_turns + 1).isApprox(
      Eigen::Rotation2Df(M_PI_2) * rectangle.axisRotated(quarter_turns), 1e-5f
    ));
  }
}

TEST(geometry, min_area_rectangle_rejects_degenerate_sets)
{
  std::vector<Eigen::Vector2f> line;

  for (int i = 0; i < 20; ++i) {
    line.emplace_back(0.01f * i, 0.005f * i);
  }

  EXPECT_THROW(fit_min_area_rectangle(line, 0.02f), DegenerateFitError);
  EXPECT_THROW(fit_min_area_rectangle({ Eigen::Vector2f(0.0f, 0.0f) }, 0.02f), DegenerateFitError);
  EXPECT_THROW(
    fit_min_area_rectangle({ { 0.0f, 0.0f }, { 0.01f, 0.0f }, { 0.0f, 0.01f } }, 0.02f), DegenerateFitError
  );
}
