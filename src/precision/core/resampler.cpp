#include "precision/core/resampler.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <vector>

namespace cutprec::precision::core {

namespace {

//! Minimum number of points produced from a step size.
static constexpr int MIN_STEP_POINTS = 8;

} // namespace

double closedPerimeter(const Contour& points) {
	double perimeter = 0.0;
	for (std::size_t i = 0; i < points.size(); ++i) {
		const cv::Point2f& a = points[i];
		const cv::Point2f& b = points[(i + 1) % points.size()];
		perimeter += std::hypot(static_cast<double>(b.x) - a.x, static_cast<double>(b.y) - a.y);
	}
	return perimeter;
}

Contour resampleClosedContour(const Contour& points, double stepPx, std::optional<int> numPoints, int maxPoints) {
	if (points.size() < 3u) {
		throw std::invalid_argument("Contour needs at least 3 points for resampling");
	}

	// Cumulative arc length at the start of every segment. Segment i goes from point i to point i+1 (wrapping).
	const std::size_t n = points.size();
	std::vector<double> cumulative(n + 1, 0.0);
	for (std::size_t i = 0; i < n; ++i) {
		const cv::Point2f& a = points[i];
		const cv::Point2f& b = points[(i + 1) % n];
		cumulative[i + 1]    = cumulative[i] + std::hypot(static_cast<double>(b.x) - a.x, static_cast<double>(b.y) - a.y);
	}

	const double perimeter = cumulative.back();
	if (perimeter <= 0.0) {
		throw std::invalid_argument("Contour perimeter is zero");
	}

	int count = 0;
	if (numPoints) {
		if (*numPoints < 1) {
			throw std::invalid_argument("numPoints must be positive");
		}
		count = *numPoints;
	} else {
		if (stepPx <= 0.0) {
			throw std::invalid_argument("stepPx must be positive");
		}
		// Clamp before the cast, a tiny step overflows int.
		const double upper = static_cast<double>(std::max(MIN_STEP_POINTS, maxPoints));
		count              = static_cast<int>(std::clamp(std::ceil(perimeter / stepPx), static_cast<double>(MIN_STEP_POINTS), upper));
	}

	Contour out;
	out.reserve(static_cast<std::size_t>(count));

	std::size_t segment = 0;
	for (int k = 0; k < count; ++k) {
		const double target = perimeter * static_cast<double>(k) / static_cast<double>(count);
		while (segment + 1 < n && cumulative[segment + 1] <= target) {
			++segment;
		}

		const cv::Point2f& a  = points[segment];
		const cv::Point2f& b  = points[(segment + 1) % n];
		const double length   = cumulative[segment + 1] - cumulative[segment];
		const double fraction = length > 0.0 ? (target - cumulative[segment]) / length : 0.0;

		out.emplace_back(static_cast<float>(a.x + fraction * (static_cast<double>(b.x) - a.x)),
		                 static_cast<float>(a.y + fraction * (static_cast<double>(b.y) - a.y)));
	}

	return out;
}

Contour resampleClosedContour(const Contour& points, const SamplingConfig& sampling) {
	return resampleClosedContour(points, sampling.stepPx, sampling.numPoints, sampling.maxPoints);
}

} // namespace cutprec::precision::core
