#include "taskboard_perception/ros/parameter.hpp"

#include <stdexcept>
#include <string>

namespace taskboard {
namespace perception {
namespace ros {

std::size_t as_count(const rclcpp::Parameter& parameter, const std::int64_t min_value)
{
  const std::int64_t value = parameter.as_int();

  if (value < min_value) {
    throw std::invalid_argument(
      "Parameter '" + parameter.get_name() + "' must be at least " + std::to_string(min_value) + ", got "
      + std::to_string(value) + "."
    );
  }

  return static_cast<std::size_t>(value);
}

} // end namespace ros
} // end namespace perception
} // end namespace taskboard
