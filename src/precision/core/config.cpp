#include "precision/core/config.hpp"

#include <fmt/format.h>

namespace cutprec::precision::core {

namespace {

static void require(bool condition, const char* field, const std::string& message) {
	if (!condition) {
		throw ConfigError(field, message);
	}
}

static bool isUnitRatio(double value) {
	return value > 0.0 && value <= 1.0;
}

} // namespace

ConfigError::ConfigError(const std::string& field, const std::string& message) : std::invalid_argument(field + ": " + message), m_field(field) {
}

std::string_view toString(EccMotion motion) {
	switch (motion) {
	case EccMotion::Translation:
		return "translation";
	case EccMotion::Euclidean:
		return "euclidean";
	case EccMotion::Affine:
		return "affine";
	case EccMotion::Homography:
		return "homography";
	}
	return "affine";
}

EccMotion parseEccMotion(std::string_view name) {
	if (name == "translation")
		return EccMotion::Translation;
	if (name == "euclidean")
		return EccMotion::Euclidean;
	if (name == "affine")
		return EccMotion::Affine;
	if (name == "homography")
		return EccMotion::Homography;

	throw ConfigError("registration.ecc_motion", fmt::format("must be one of translation, euclidean, affine, homography (got '{}')", name));
}

void ExtractionConfig::validate() const {
	require(idealAdaptiveBlockSize >= 3 && idealAdaptiveBlockSize % 2 == 1, "extraction.ideal_adaptive_block_size", "must be odd and >= 3");
	require(idealCloseKernel >= 1, "extraction.ideal_close_kernel", "must be >= 1");
	require(idealDilateKernel >= 1, "extraction.ideal_dilate_kernel", "must be >= 1");
	require(idealMinAreaRatio >= 0.0 && idealMinAreaRatio < 1.0, "extraction.ideal_min_area_ratio", "must be in [0, 1)");
	require(isUnitRatio(idealGroupAreaRatioToMax), "extraction.ideal_group_area_ratio_to_max", "must be in (0, 1]");
	require(isUnitRatio(idealGroupCenterRadiusRatio), "extraction.ideal_group_center_radius_ratio", "must be in (0, 1]");
	require(idealGroupCloseKernel >= 1, "extraction.ideal_group_close_kernel", "must be >= 1");
	require(isUnitRatio(lineRemovalMinLengthRatio), "extraction.line_removal_min_length_ratio", "must be in (0, 1]");
	require(lineRemovalThickness >= 1, "extraction.line_removal_thickness", "must be >= 1");
	require(realLabLThreshold >= 0 && realLabLThreshold <= 255, "extraction.real_lab_l_threshold", "must be in [0, 255]");
	require(realHsvVThreshold >= 0 && realHsvVThreshold <= 255, "extraction.real_hsv_v_threshold", "must be in [0, 255]");
	require(realCloseKernel >= 1, "extraction.real_close_kernel", "must be >= 1");
	require(realOpenKernel >= 1, "extraction.real_open_kernel", "must be >= 1");
}

void RegistrationConfig::validate() const {
	require(orbNFeatures > 0, "registration.orb_nfeatures", "must be > 0");
	require(knnRatio > 0.0 && knnRatio < 1.0, "registration.knn_ratio", "must be in (0, 1)");
	require(ransacReprojThreshold > 0.0, "registration.ransac_reproj_threshold", "must be > 0");
	require(minMatches >= 4, "registration.min_matches", "must be >= 4");
	require(minInlierRatio >= 0.0 && minInlierRatio <= 1.0, "registration.min_inlier_ratio", "must be in [0, 1]");

	require(axesCannyLow >= 0.0, "registration.axes_canny_low", "must be >= 0");
	require(axesCannyLow < axesCannyHigh, "registration.axes_canny_low", "must be lower than registration.axes_canny_high");
	require(axesHoughThreshold > 0, "registration.axes_hough_threshold", "must be > 0");
	require(isUnitRatio(axesMinLineRatio), "registration.axes_min_line_ratio", "must be in (0, 1]");
	require(isUnitRatio(axesSegmentMinLineRatio), "registration.axes_segment_min_line_ratio", "must be in (0, 1]");
	require(axesMaxLineGap >= 0, "registration.axes_max_line_gap", "must be >= 0");
	require(axesAngleToleranceDeg > 0.0 && axesAngleToleranceDeg < 45.0, "registration.axes_angle_tolerance_deg", "must be in (0, 45)");
	require(axesHorizontalRoiMinYRatio >= 0.0 && axesHorizontalRoiMinYRatio <= 1.0, "registration.axes_horizontal_roi_min_y_ratio", "must be in [0, 1]");
	require(axesVerticalRoiMaxXRatio >= 0.0 && axesVerticalRoiMaxXRatio <= 1.0, "registration.axes_vertical_roi_max_x_ratio", "must be in [0, 1]");

	require(eccIterations > 0, "registration.ecc_iterations", "must be > 0");
	require(eccEps > 0.0, "registration.ecc_eps", "must be > 0");
}

void CalibrationConfig::validate() const {
	require(!manualMmPerPx || *manualMmPerPx > 0.0, "calibration.manual_mm_per_px", "must be > 0 when set");
	require(rulerMm > 0.0, "calibration.ruler_mm", "must be > 0");
	require(cannyLow >= 0.0, "calibration.canny_low", "must be >= 0");
	require(cannyLow < cannyHigh, "calibration.canny_low", "must be lower than calibration.canny_high");
	require(houghThreshold > 0, "calibration.hough_threshold", "must be > 0");
	require(houghMaxGap >= 0, "calibration.hough_max_gap", "must be >= 0");
	require(isUnitRatio(rulerMinLineRatio), "calibration.ruler_min_line_ratio", "must be in (0, 1]");
}

void DistanceConfig::validate() const {
	require(drawThickness >= 1, "distance.draw_thickness", "must be >= 1");
	require(validationTolerancePx >= 0.0, "distance.validation_tolerance_px", "must be >= 0");
}

void MetricsConfig::validate() const {
	require(tau > 0.0, "metrics.tau", "must be > 0");
	require(clampLow < clampHigh, "metrics.clamp_low", "must be lower than metrics.clamp_high");
}

void SamplingConfig::validate() const {
	require(stepPx > 0.0, "sampling.step_px", "must be > 0");
	require(!numPoints || *numPoints >= 3, "sampling.num_points", "must be >= 3 when set");
	require(maxPoints >= 8, "sampling.max_points", "must be >= 8");
}

void AppConfig::validate() const {
	extraction.validate();
	registration.validate();
	calibration.validate();
	distance.validate();
	metrics.validate();
	sampling.validate();
}

} // namespace cutprec::precision::core
