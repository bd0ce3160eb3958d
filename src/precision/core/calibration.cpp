#include "precision/core/calibration.hpp"

#include "statistics.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

#include <opencv2/imgproc.hpp>

namespace cutprec::precision::core {

namespace {

//! Segments may deviate this many pixels (or this fraction of their length) from axis alignment.
static constexpr double AXIS_SLACK_PX    = 2.0;
static constexpr double AXIS_SLACK_RATIO = 0.2;

static CalibrationResult missing(double reason) {
	CalibrationResult result{};
	result.status  = CalibrationStatus::Missing;
	result.method  = CalibrationMethod::RulerDetection;
	result.details = {{"reason", reason}};
	return result;
}

} // namespace

const char* toString(CalibrationStatus status) {
	return status == CalibrationStatus::Ok ? "ok" : "missing";
}

const char* toString(CalibrationMethod method) {
	return method == CalibrationMethod::Manual ? "manual" : "ruler_detection";
}

CalibrationResult estimateMmPerPx(const cv::Mat& image, const CalibrationConfig& config) {
	if (config.manualMmPerPx) {
		CalibrationResult result{};
		result.mmPerPx = config.manualMmPerPx;
		result.status  = CalibrationStatus::Ok;
		result.method  = CalibrationMethod::Manual;
		result.details = {{"ruler_mm", config.rulerMm}};
		return result;
	}

	cv::Mat gray;
	if (image.channels() == 1) {
		gray = image;
	} else {
		cv::cvtColor(image, gray, image.channels() == 4 ? cv::COLOR_BGRA2GRAY : cv::COLOR_BGR2GRAY);
	}

	cv::Mat edges;
	cv::Canny(gray, edges, config.cannyLow, config.cannyHigh);

	const double minLength = std::max(gray.rows, gray.cols) * config.rulerMinLineRatio;
	std::vector<cv::Vec4i> lines;
	cv::HoughLinesP(edges, lines, 1.0, CV_PI / 180.0, config.houghThreshold, minLength, config.houghMaxGap);
	if (lines.empty()) {
		return missing(calibration_reason::NO_LINES);
	}

	std::vector<double> horizontal, vertical;
	for (const auto& l: lines) {
		const double dx     = std::abs(static_cast<double>(l[2] - l[0]));
		const double dy     = std::abs(static_cast<double>(l[3] - l[1]));
		const double length = std::hypot(dx, dy);
		if (dy <= std::max(AXIS_SLACK_PX, AXIS_SLACK_RATIO * dx)) {
			horizontal.push_back(length);
		} else if (dx <= std::max(AXIS_SLACK_PX, AXIS_SLACK_RATIO * dy)) {
			vertical.push_back(length);
		}
	}

	std::vector<double> candidates;
	if (!horizontal.empty()) {
		candidates.push_back(median(horizontal));
	}
	if (!vertical.empty()) {
		candidates.push_back(median(vertical));
	}
	if (candidates.empty()) {
		return missing(calibration_reason::NO_CANDIDATES);
	}

	const double rulerPx = median(candidates);
	if (rulerPx <= 0.0) {
		return missing(calibration_reason::NON_POSITIVE_SIZE);
	}

	CalibrationResult result{};
	result.mmPerPx = config.rulerMm / rulerPx;
	result.status  = CalibrationStatus::Ok;
	result.method  = CalibrationMethod::RulerDetection;
	result.details = {{"px_ruler", rulerPx}};
	if (!horizontal.empty()) {
		result.details["horiz_median"] = median(horizontal);
	}
	if (!vertical.empty()) {
		result.details["vert_median"] = median(vertical);
	}
	return result;
}

} // namespace cutprec::precision::core
