#pragma once

#include "precision/core/contour.hpp"

#include <optional>
#include <vector>

namespace cutprec::precision::core {

//! Summary of a distance distribution. Units follow the input (px or mm).
struct MetricsSummary {
	double mad{0.0};      //!< Arithmetic mean of the distances.
	double std{0.0};      //!< Population standard deviation.
	double p95{0.0};      //!< 95th percentile, linear interpolation between ranks.
	double maxError{0.0}; //!< Largest distance.
};

//! Symmetric contour comparison from nearest neighbour distances in both directions.
struct ContourDiagnostics {
	double madRealToIdeal{0.0};
	double madIdealToReal{0.0};
	double bidirectionalMad{0.0}; //!< Mean of both directional means.
	double hausdorff{0.0};        //!< Maximum over both directions.
};

struct IpnResult {
	double ipn{0.0};       //!< Precision score in [clampLow, clampHigh].
	double tolerance{0.0}; //!< tau * scale, in the units of the scale.
};

//! \throws std::invalid_argument on empty input.
MetricsSummary computeStatistics(const std::vector<double>& distances);

//! Diagonal of the axis aligned bounding box of the points. Zero for an empty set.
double bboxDiagonal(const Contour& points);

//! Index of precision: 100 * (1 - mad / (tau * scale)), clamped.
//! \throws std::invalid_argument if scale <= 0 or tau <= 0.
IpnResult computeIpn(double mad, double scale, double tau, double clampLow = 0.0, double clampHigh = 100.0);

//! Multiply every distance by mmPerPx. Absent without calibration.
std::optional<std::vector<double>> toMm(const std::vector<double>& valuesPx, std::optional<double> mmPerPx);

//! \throws std::invalid_argument if either direction is empty.
ContourDiagnostics computeBidirectionalDiagnostics(const std::vector<double>& realToIdeal, const std::vector<double>& idealToReal);

} // namespace cutprec::precision::core
