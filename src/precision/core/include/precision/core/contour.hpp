#pragma once

#include <opencv2/core/types.hpp>

#include <vector>

namespace cutprec::precision::core {

//! Ordered closed outline in pixel coordinates. The last point connects back to the first.
using Contour = std::vector<cv::Point2f>;

} // namespace cutprec::precision::core
