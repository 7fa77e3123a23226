#include <gtest/gtest.h>

#include "synthetic_taskboard.hpp"

#include <taskboard_perception/point_cloud_cropper.hpp>

#include <limits>
#include <stdexcept>

using taskboard::perception::BoundingBox;
using taskboard::perception::CameraIntrinsics;
using taskboard::perception::PointCloudCropper;
using taskboard::perception::PointCluster;

static BoundingBox box(const std::string& label, int xmin, int xmax, int ymin, int ymax, float confidence = 0.9f)
{
  BoundingBox bounding_box;

  bounding_box.label = label;
  bounding_box.xmin = xmin;
  bounding_box.xmax = xmax;
  bounding_box.ymin = ymin;
  bounding_box.ymax = ymax;
  bounding_box.confidence = confidence;

  return bounding_box;
}

// fx = 512, cx = 320, cy = 256: a point at z = 1 and x = k / 512 projects exactly to u = 320 + k.
static Eigen::Vector3f point_at_pixel(const int u, const int v)
{
  return Eigen::Vector3f((u - 320) / 512.0f, (v - 256) / 512.0f, 1.0f);
}

TEST(point_cloud_cropper, boundary_is_inclusive)
{
  const PointCloudCropper cropper(taskboard::perception::test::make_intrinsics(), PointCloudCropper::Parameter());
  const PointCluster points = {
    point_at_pixel(384, 300),   // on xmax
    point_at_pixel(320, 300),   // on xmin
    point_at_pixel(350, 288),   // on ymin
    point_at_pixel(350, 320),   // on ymax
    point_at_pixel(385, 300),   // one pixel right of xmax
    point_at_pixel(319, 300),   // one pixel left of xmin
    point_at_pixel(350, 287),   // one pixel above ymin
    point_at_pixel(350, 321)    // one pixel below ymax
  };

  const auto clusters = cropper({ box("red", 320, 384, 288, 320) }, points);

  ASSERT_EQ(clusters.count("red"), 1u);
  const auto& red = clusters.at("red");
  ASSERT_EQ(red.size(), 4u);

  for (std::size_t i = 0; i < 4; ++i) {
    EXPECT_TRUE(red[i].isApprox(points[i]));
  }
}

TEST(point_cloud_cropper, empty_cluster_is_omitted)
{
  const PointCloudCropper cropper(taskboard::perception::test::make_intrinsics(), PointCloudCropper::Parameter());
  const PointCluster points = { point_at_pixel(100, 100) };

  const auto clusters = cropper({ box("red", 90, 110, 90, 110), box("blue", 300, 310, 300, 310) }, points);

  EXPECT_EQ(clusters.size(), 1u);
  EXPECT_EQ(clusters.count("red"), 1u);
  EXPECT_EQ(clusters.count("blue"), 0u);
}

TEST(point_cloud_cropper, overlapping_boxes_share_points)
{
  PointCloudCropper::Parameter parameter;
  parameter.board_region_encloses_landmarks = false;
  const PointCloudCropper cropper(taskboard::perception::test::make_intrinsics(), parameter);
  const PointCluster points = { point_at_pixel(200, 200), point_at_pixel(250, 250) };

  const auto clusters = cropper(
    { box("taskboard", 150, 300, 150, 300), box("red", 190, 210, 190, 210) }, points
  );

  ASSERT_EQ(clusters.count("taskboard"), 1u);
  ASSERT_EQ(clusters.count("red"), 1u);
  EXPECT_EQ(clusters.at("taskboard").size(), 2u);
  EXPECT_EQ(clusters.at("red").size(), 1u);
}

TEST(point_cloud_cropper, invalid_points_are_skipped)
{
  const PointCloudCropper cropper(taskboard::perception::test::make_intrinsics(), PointCloudCropper::Parameter());
  const float nan = std::numeric_limits<float>::quiet_NaN();
  const PointCluster points = {
    Eigen::Vector3f(nan, nan, nan),
    Eigen::Vector3f(0.0f, 0.0f, nan),
    Eigen::Vector3f(0.0f, 0.0f, 0.0f),
    Eigen::Vector3f(0.0f, 0.0f, -1.0f),
    point_at_pixel(320, 256)
  };

  const auto clusters = cropper({ box("red", 0, 640, 0, 512) }, points);

  ASSERT_EQ(clusters.count("red"), 1u);
  EXPECT_EQ(clusters.at("red").size(), 1u);
}

TEST(point_cloud_cropper, most_confident_box_per_label_wins)
{
  PointCloudCropper::Parameter parameter;
  parameter.min_confidence = 0.5f;
  const PointCloudCropper cropper(taskboard::perception::test::make_intrinsics(), parameter);

  const auto regions = cropper.selectRegions({
    box("red", 0, 10, 0, 10, 0.6f),
    box("red", 100, 110, 100, 110, 0.8f),
    box("blue", 50, 60, 50, 60, 0.3f)
  });

  ASSERT_EQ(regions.size(), 1u);
  EXPECT_EQ(regions[0].label, "red");
  EXPECT_EQ(regions[0].xmin, 100);
  EXPECT_FLOAT_EQ(regions[0].confidence, 0.8f);
}

TEST(point_cloud_cropper, board_region_encloses_intersecting_landmarks)
{
  const PointCloudCropper cropper(taskboard::perception::test::make_intrinsics(), PointCloudCropper::Parameter());

  const auto regions = cropper.selectRegions({
    box("taskboard", 100, 300, 100, 300),
    box("red", 280, 330, 120, 140),      // sticks out of the board box
    box("blue", 500, 520, 500, 520)      // somewhere else
  });

  for (const auto& region : regions) {
    if (region.label == "taskboard") {
      EXPECT_EQ(region.xmin, 100);
      EXPECT_EQ(region.xmax, 330);
      EXPECT_EQ(region.ymin, 100);
      EXPECT_EQ(region.ymax, 300);
    }
  }

  PointCloudCropper::Parameter parameter;
  parameter.board_region_encloses_landmarks = false;
  const PointCloudCropper cropper_own_box(taskboard::perception::test::make_intrinsics(), parameter);

  for (const auto& region : cropper_own_box.selectRegions({ box("taskboard", 100, 300, 100, 300),
                                                             box("red", 280, 330, 120, 140) })) {
    if (region.label == "taskboard") {
      EXPECT_EQ(region.xmax, 300);
    }
  }
}

TEST(point_cloud_cropper, requires_valid_intrinsics)
{
  EXPECT_THROW(PointCloudCropper(CameraIntrinsics(), PointCloudCropper::Parameter()), std::invalid_argument);
}
