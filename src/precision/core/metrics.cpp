#include "precision/core/metrics.hpp"

#include "statistics.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <stdexcept>

namespace cutprec::precision::core {

MetricsSummary computeStatistics(const std::vector<double>& distances) {
	if (distances.empty()) {
		throw std::invalid_argument("Distance array is empty");
	}

	MetricsSummary summary{};
	summary.mad      = mean(distances);
	summary.std      = populationStddev(distances);
	summary.p95      = percentile(distances, 95.0);
	summary.maxError = *std::max_element(distances.begin(), distances.end());
	return summary;
}

double bboxDiagonal(const Contour& points) {
	if (points.empty()) {
		return 0.0;
	}

	const auto [minX, maxX] = std::minmax_element(points.begin(), points.end(), [](const cv::Point2f& a, const cv::Point2f& b) { return a.x < b.x; });
	const auto [minY, maxY] = std::minmax_element(points.begin(), points.end(), [](const cv::Point2f& a, const cv::Point2f& b) { return a.y < b.y; });
	return std::hypot(static_cast<double>(maxX->x) - minX->x, static_cast<double>(maxY->y) - minY->y);
}

IpnResult computeIpn(double mad, double scale, double tau, double clampLow, double clampHigh) {
	if (scale <= 0.0) {
		throw std::invalid_argument("Scale must be > 0 for IPN");
	}
	if (tau <= 0.0) {
		throw std::invalid_argument("tau must be > 0 for IPN");
	}

	const double tolerance = tau * scale;
	const double raw       = 100.0 * (1.0 - mad / tolerance);
	return {std::clamp(raw, clampLow, clampHigh), tolerance};
}

std::optional<std::vector<double>> toMm(const std::vector<double>& valuesPx, std::optional<double> mmPerPx) {
	if (!mmPerPx) {
		return std::nullopt;
	}

	std::vector<double> out;
	out.reserve(valuesPx.size());
	std::transform(valuesPx.begin(), valuesPx.end(), std::back_inserter(out), [factor = *mmPerPx](double v) { return v * factor; });
	return out;
}

ContourDiagnostics computeBidirectionalDiagnostics(const std::vector<double>& realToIdeal, const std::vector<double>& idealToReal) {
	if (realToIdeal.empty() || idealToReal.empty()) {
		throw std::invalid_argument("Diagnostics require non-empty distance arrays");
	}

	ContourDiagnostics diagnostics{};
	diagnostics.madRealToIdeal   = mean(realToIdeal);
	diagnostics.madIdealToReal   = mean(idealToReal);
	diagnostics.bidirectionalMad = 0.5 * (diagnostics.madRealToIdeal + diagnostics.madIdealToReal);
	diagnostics.hausdorff =
	        std::max(*std::max_element(realToIdeal.begin(), realToIdeal.end()), *std::max_element(idealToReal.begin(), idealToReal.end()));
	return diagnostics;
}

} // namespace cutprec::precision::core
