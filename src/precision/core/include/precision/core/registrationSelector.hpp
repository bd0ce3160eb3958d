#pragma once

#include "precision/core/contour.hpp"
#include "precision/core/registration.hpp"

#include <optional>
#include <vector>

namespace cutprec::precision::core {

//! Diagnostic row for one registration candidate.
struct RegistrationCandidateRow {
	RegistrationResult result;
	std::optional<double> selectionMadPx{}; //!< Absent if the candidate failed.
};

struct RegistrationSelection {
	RegistrationResult selected;                      //!< Candidate with the lowest contour MAD, or the first candidate if none succeeded.
	std::optional<double> selectionMadPx{};           //!< MAD of the selected candidate. Absent if no candidate succeeded.
	std::vector<RegistrationCandidateRow> candidates; //!< One row per input candidate, same order.
};

//! Pick the registration that brings the real contour closest to the ideal contour.
//! Every successful candidate warps the real contour, which is resampled to idealPoints.size() points and compared with
//! nearest neighbour distances. Ties keep the earlier candidate.
//! \param [in] candidates  Results of the estimators, at least one.
//! \param [in] realContour Extracted outline in test image coordinates.
//! \param [in] idealPoints Resampled ideal outline in template coordinates.
//! \throws     std::invalid_argument if there are no candidates.
RegistrationSelection selectRegistration(const std::vector<RegistrationResult>& candidates, const Contour& realContour, const Contour& idealPoints);

} // namespace cutprec::precision::core
