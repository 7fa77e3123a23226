/**
 * Copyright EduArt Robotik GmbH 2024
 *
 * Author: Christian Wendt (christian.wendt@eduart-robotik.com)
 */
#pragma once

#include "taskboard_perception/bounding_box.hpp"

#include <opencv2/core.hpp>

#include <map>
#include <string>
#include <vector>

namespace taskboard {
namespace perception {

// label --> (R, G, B) in range [0, 255]
using ClassColorMap = std::map<std::string, cv::Scalar>;

/**
 * \brief Builds the color map from a flat list of RGB values, three per label.
 * \throw Throws an std::invalid_argument if the number of values doesn't match the number of labels.
 */
ClassColorMap make_class_color_map(const std::vector<std::string>& labels, const std::vector<double>& rgb_values);

/**
 * \brief Looks up the color of a class.
 * \returns False if the label is unknown, color is untouched then.
 */
bool find_class_color(const ClassColorMap& class_colors, const std::string& label, cv::Scalar& color);

/**
 * \brief Like find_class_color(), but returns a random color for unknown labels.
 */
cv::Scalar get_class_color(const ClassColorMap& class_colors, const std::string& label);

/**
 * \brief Like get_class_color(), but a random color given to an unknown label is stored in class_colors, so the label
 *        keeps its color from then on.
 * \param assigned Set to true if the label was unknown and got a new color.
 */
cv::Scalar assign_class_color(ClassColorMap& class_colors, const std::string& label, bool& assigned);

/**
 * \brief Draws the bounding boxes into a copy of the given BGR image. Each box gets a slightly transparent label
 *        showing class and confidence.
 */
cv::Mat annotate_image(
  const cv::Mat& image, const std::vector<BoundingBox>& bounding_boxes, const ClassColorMap& class_colors);

} // end namespace perception
} // end namespace taskboard
