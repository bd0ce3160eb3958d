#pragma once

#include "precision/core/config.hpp"
#include "precision/core/debugVisualizer.hpp"

#include <opencv2/core/mat.hpp>
#include <opencv2/core/types.hpp>

#include <optional>

namespace cutprec::precision::core {

//! Coordinate frame spanned by a horizontal and a vertical reference line.
struct AxisFrame {
	cv::Point2d origin;      //!< Intersection of both axes.
	cv::Point2d horizontal;  //!< Unit direction, pointing right (x >= 0).
	cv::Point2d vertical;    //!< Unit direction, pointing up (y <= 0).
	double horizontalSpan{}; //!< Robust extent of the horizontal axis from the origin.
	double verticalSpan{};   //!< Robust extent of the vertical axis from the origin.
};

//! Detect the axis frame of an image. Empty if no consistent, non-degenerate pair of axes is found.
std::optional<AxisFrame> detectAxisFrame(const cv::Mat& image, const RegistrationConfig& config, DebugVisualizer* debugger = nullptr);

} // namespace cutprec::precision::core
