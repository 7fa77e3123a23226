/**
 * Copyright EduArt Robotik GmbH 2024
 *
 * Author: Christian Wendt (christian.wendt@eduart-robotik.com)
 */
#pragma once

#include <rclcpp/parameter.hpp>

#include <cstddef>
#include <cstdint>

namespace taskboard {
namespace perception {
namespace ros {

/**
 * \brief Reads an integer parameter that is used as count or size.
 * \throw Throws an std::invalid_argument if the value is below min_value.
 */
std::size_t as_count(const rclcpp::Parameter& parameter, const std::int64_t min_value);

} // end namespace ros
} // end namespace perception
} // end namespace taskboard
