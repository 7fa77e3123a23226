#include "taskboard_perception/detection_drawing.hpp"

#include <opencv2/imgproc.hpp>

#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>

namespace taskboard {
namespace perception {

static constexpr int LABEL_FONT = cv::FONT_HERSHEY_SIMPLEX;
static constexpr double LABEL_FONT_SCALE = 0.5;
static constexpr double LABEL_ALPHA = 0.5;

static cv::Scalar rgb_to_bgr(const cv::Scalar& rgb)
{
  return cv::Scalar(rgb[2], rgb[1], rgb[0]);
}

ClassColorMap make_class_color_map(const std::vector<std::string>& labels, const std::vector<double>& rgb_values)
{
  if (labels.size() * 3 != rgb_values.size()) {
    throw std::invalid_argument("make_class_color_map: three color values are required per label!");
  }

  ClassColorMap class_colors;

  for (std::size_t i = 0; i < labels.size(); ++i) {
    class_colors[labels[i]] = cv::Scalar(rgb_values[i * 3 + 0], rgb_values[i * 3 + 1], rgb_values[i * 3 + 2]);
  }

  return class_colors;
}

bool find_class_color(const ClassColorMap& class_colors, const std::string& label, cv::Scalar& color)
{
  const auto search = class_colors.find(label);

  if (search == class_colors.end()) {
    return false;
  }

  color = search->second;
  return true;
}

cv::Scalar get_class_color(const ClassColorMap& class_colors, const std::string& label)
{
  cv::Scalar color;

  if (find_class_color(class_colors, label, color)) {
    return color;
  }

  static std::mt19937 generator(std::random_device{}());
  std::uniform_real_distribution<double> distribution(0.0, 255.0);

  return cv::Scalar(distribution(generator), distribution(generator), distribution(generator));
}

cv::Scalar assign_class_color(ClassColorMap& class_colors, const std::string& label, bool& assigned)
{
  cv::Scalar color;
  assigned = !find_class_color(class_colors, label, color);

  if (assigned) {
    color = get_class_color(class_colors, label);
    class_colors[label] = color;
  }

  return color;
}

cv::Mat annotate_image(
  const cv::Mat& image, const std::vector<BoundingBox>& bounding_boxes, const ClassColorMap& class_colors)
{
  cv::Mat annotated = image.clone();

  for (const auto& box : bounding_boxes) {
    const cv::Scalar color = rgb_to_bgr(get_class_color(class_colors, box.label));

    cv::rectangle(annotated, cv::Point(box.xmin, box.ymin), cv::Point(box.xmax, box.ymax), color, 2);

    std::ostringstream label_text;
    label_text << box.label << ": " << std::fixed << std::setprecision(2) << box.confidence * 100.0f << "%";

    int base_line = 0;
    const cv::Size text_size = cv::getTextSize(label_text.str(), LABEL_FONT, LABEL_FONT_SCALE, 1, &base_line);

    // Label box and text are blended in so they don't hide what is below.
    cv::Mat overlay = annotated.clone();
    cv::rectangle(
      overlay,
      cv::Point(box.xmin, box.ymin - static_cast<int>(text_size.height * 1.5)),
      cv::Point(box.xmin + text_size.width, box.ymin),
      color, cv::FILLED
    );
    cv::putText(
      overlay, label_text.str(), cv::Point(box.xmin, box.ymin - 5), LABEL_FONT, LABEL_FONT_SCALE,
      cv::Scalar(255, 255, 255), 1
    );
    cv::addWeighted(overlay, LABEL_ALPHA, annotated, 1.0 - LABEL_ALPHA, 0.0, annotated);
  }

  return annotated;
}

} // end namespace perception
} // end namespace taskboard
