#pragma once

#include "precision/core/config.hpp"

#include <opencv2/core/mat.hpp>

#include <map>
#include <optional>
#include <string>

namespace cutprec::precision::core {

enum class CalibrationStatus { Ok, Missing };
enum class CalibrationMethod { Manual, RulerDetection };

const char* toString(CalibrationStatus status);
const char* toString(CalibrationMethod method);

//! Reason codes stored in details["reason"] when ruler detection fails.
namespace calibration_reason {
static constexpr double NO_LINES          = 1.0;
static constexpr double NO_CANDIDATES     = 2.0;
static constexpr double NON_POSITIVE_SIZE = 3.0;
} // namespace calibration_reason

struct CalibrationResult {
	std::optional<double> mmPerPx{};
	CalibrationStatus status{CalibrationStatus::Missing};
	CalibrationMethod method{CalibrationMethod::RulerDetection};
	std::map<std::string, double> details{}; //!< Numeric diagnostics (ruler length in px, medians, reason code).
};

//! Millimeters per pixel from the manual override or from the reference ruler in the image.
//! The ruler length is the median of the median horizontal and median vertical long line segment.
CalibrationResult estimateMmPerPx(const cv::Mat& image, const CalibrationConfig& config);

} // namespace cutprec::precision::core
