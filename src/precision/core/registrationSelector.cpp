#include "precision/core/registrationSelector.hpp"

#include "precision/core/distance.hpp"
#include "precision/core/resampler.hpp"
#include "statistics.hpp"

#include <cmath>
#include <optional>
#include <stdexcept>

namespace cutprec::precision::core {

namespace {

//! Mean distance from the warped, resampled real contour to the ideal points.
//! Empty when the homography is degenerate and collapses the contour or produces non-finite points.
static std::optional<double> contourMad(const RegistrationResult& candidate, const Contour& realContour, const Contour& idealPoints) {
	const Contour warped   = warpPoints(realContour, candidate.homography);
	const double perimeter = closedPerimeter(warped);
	if (!std::isfinite(perimeter) || perimeter <= 0.0) {
		return std::nullopt;
	}

	const Contour resampled = resampleClosedContour(warped, 1.0, static_cast<int>(idealPoints.size()));
	const double mad        = mean(nearestNeighborDistances(resampled, idealPoints));
	if (!std::isfinite(mad)) {
		return std::nullopt;
	}
	return mad;
}

} // namespace

RegistrationSelection selectRegistration(const std::vector<RegistrationResult>& candidates, const Contour& realContour, const Contour& idealPoints) {
	if (candidates.empty()) {
		throw std::invalid_argument("No registration candidates");
	}

	RegistrationSelection selection{candidates.front(), std::nullopt, {}};
	selection.candidates.reserve(candidates.size());

	for (const auto& candidate: candidates) {
		RegistrationCandidateRow row{candidate, std::nullopt};
		if (candidate.success) {
			row.selectionMadPx = contourMad(candidate, realContour, idealPoints);
			if (row.selectionMadPx && (!selection.selectionMadPx || *row.selectionMadPx < *selection.selectionMadPx)) {
				selection.selected       = candidate;
				selection.selectionMadPx = row.selectionMadPx;
			}
		}
		selection.candidates.push_back(std::move(row));
	}

	return selection;
}

} // namespace cutprec::precision::core
