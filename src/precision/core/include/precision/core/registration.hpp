#pragma once

#include "precision/core/config.hpp"
#include "precision/core/contour.hpp"
#include "precision/core/debugVisualizer.hpp"

#include <opencv2/core/mat.hpp>

#include <optional>
#include <string_view>
#include <vector>

namespace cutprec::precision::core {

//! Estimator that produced a registration result.
enum class RegistrationMethod {
	OrbHomography, //!< ORB keypoints, ratio test, RANSAC homography.
	AxesFallback,  //!< Affine transform between two detected reference axes.
	EccFallback,   //!< Intensity based ECC alignment.
};

//! Reason a registration estimator gave up.
enum class RegistrationFailure {
	MissingDescriptors,
	NotEnoughMatches,
	HomographyFailed,
	LowInlierRatio,
	AxisDetectionFailed,
	AxisSingularBasis,
	EccFailed,
};

std::string_view toString(RegistrationMethod method);
std::string_view toString(RegistrationFailure failure);

//! Transform that maps test image coordinates onto template coordinates.
struct RegistrationResult {
	bool success{false};
	cv::Mat homography{cv::Mat::eye(3, 3, CV_64F)}; //!< 3x3 CV_64F. Identity whenever success is false.
	RegistrationMethod method{RegistrationMethod::OrbHomography};
	int matchesTotal{0};                              //!< Raw descriptor matches (ORB only).
	int matchesUsed{0};                               //!< Matches passing the ratio test (ORB only).
	double inlierRatio{0.0};                          //!< RANSAC inliers / used matches. 1 for axes, correlation coefficient for ECC.
	std::optional<double> reprojectionErrorPx{};      //!< Mean inlier reprojection error (ORB only).
	std::optional<RegistrationFailure> reason{};      //!< Set when success is false.
};

//! Feature based registration of the test photo onto the template.
RegistrationResult estimateHomographyOrb(const cv::Mat& templateImage, const cv::Mat& testImage, const RegistrationConfig& config);

//! Registration from the dominant horizontal and vertical reference lines (e.g. a drawn axis cross) of both images.
RegistrationResult estimateHomographyAxes(const cv::Mat& templateImage, const cv::Mat& testImage, const RegistrationConfig& config,
                                          DebugVisualizer* debugger = nullptr);

//! Intensity based alignment. The test image is resized to the template size for the optimisation.
RegistrationResult estimateHomographyEcc(const cv::Mat& templateImage, const cv::Mat& testImage, const RegistrationConfig& config);

//! ORB followed by every enabled fallback (axes, then ECC).
std::vector<RegistrationResult> estimateRegistrationCandidates(const cv::Mat& templateImage, const cv::Mat& testImage, const RegistrationConfig& config,
                                                               DebugVisualizer* debugger = nullptr);

//! Apply a 3x3 projective transform to every point.
Contour warpPoints(const Contour& points, const cv::Mat& homography);

} // namespace cutprec::precision::core
