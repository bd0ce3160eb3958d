#pragma once

#include "precision/core/config.hpp"
#include "precision/core/contour.hpp"

#include <optional>

namespace cutprec::precision::core {

//! Resample a closed contour to points spaced uniformly by arc length.
//! \param [in] points    Ordered outline with at least 3 points and non-zero perimeter. Closed implicitly.
//! \param [in] stepPx    Target spacing. Ignored when numPoints is set.
//! \param [in] numPoints Exact number of output points.
//! \param [in] maxPoints Upper bound for the step derived count.
//! \return     ceil(perimeter / stepPx) points clamped to [8, maxPoints], or exactly numPoints. First point equals the input start.
//! \throws     std::invalid_argument for degenerate input.
Contour resampleClosedContour(const Contour& points, double stepPx = 1.5, std::optional<int> numPoints = std::nullopt, int maxPoints = 20000);

//! Same as above with the parameters taken from the sampling section.
Contour resampleClosedContour(const Contour& points, const SamplingConfig& sampling);

//! Perimeter of the closed polygon.
double closedPerimeter(const Contour& points);

} // namespace cutprec::precision::core
