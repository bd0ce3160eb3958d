#include "precision/core/registration.hpp"

#include "axisFrame.hpp"

#include <cmath>

#include <opencv2/calib3d.hpp>
#include <opencv2/features2d.hpp>
#include <opencv2/imgproc.hpp>
#include <opencv2/video/tracking.hpp>

namespace cutprec::precision::core {

namespace {

//! Smoothing applied by ECC to both images before optimisation.
static constexpr int ECC_GAUSS_FILTER_SIZE = 5;
//! Minimum |det| of the source axis basis.
static constexpr double MIN_BASIS_DETERMINANT = 1e-6;

static cv::Mat toGray(const cv::Mat& image) {
	if (image.channels() == 1) {
		return image;
	}
	cv::Mat gray;
	cv::cvtColor(image, gray, image.channels() == 4 ? cv::COLOR_BGRA2GRAY : cv::COLOR_BGR2GRAY);
	return gray;
}

static RegistrationResult failure(RegistrationMethod method, RegistrationFailure reason) {
	RegistrationResult result{};
	result.success = false;
	result.method  = method;
	result.reason  = reason;
	return result;
}

static int toOpenCvMotion(EccMotion motion) {
	switch (motion) {
	case EccMotion::Translation:
		return cv::MOTION_TRANSLATION;
	case EccMotion::Euclidean:
		return cv::MOTION_EUCLIDEAN;
	case EccMotion::Affine:
		return cv::MOTION_AFFINE;
	case EccMotion::Homography:
		return cv::MOTION_HOMOGRAPHY;
	}
	return cv::MOTION_AFFINE;
}

static double meanReprojectionError(const std::vector<cv::Point2f>& src, const std::vector<cv::Point2f>& dst, const cv::Mat& H) {
	std::vector<cv::Point2f> projected;
	cv::perspectiveTransform(src, projected, H);

	double sum = 0.0;
	for (std::size_t i = 0; i < projected.size(); ++i) {
		sum += std::hypot(static_cast<double>(projected[i].x) - dst[i].x, static_cast<double>(projected[i].y) - dst[i].y);
	}
	return sum / static_cast<double>(projected.size());
}

} // namespace

std::string_view toString(RegistrationMethod method) {
	switch (method) {
	case RegistrationMethod::OrbHomography:
		return "orb_homography";
	case RegistrationMethod::AxesFallback:
		return "axes_fallback";
	case RegistrationMethod::EccFallback:
		return "ecc_fallback";
	}
	return "unknown";
}

std::string_view toString(RegistrationFailure failure) {
	switch (failure) {
	case RegistrationFailure::MissingDescriptors:
		return "missing_descriptors";
	case RegistrationFailure::NotEnoughMatches:
		return "not_enough_matches";
	case RegistrationFailure::HomographyFailed:
		return "homography_failed";
	case RegistrationFailure::LowInlierRatio:
		return "low_inlier_ratio";
	case RegistrationFailure::AxisDetectionFailed:
		return "axis_detection_failed";
	case RegistrationFailure::AxisSingularBasis:
		return "axis_singular_basis";
	case RegistrationFailure::EccFailed:
		return "ecc_failed";
	}
	return "unknown";
}

RegistrationResult estimateHomographyOrb(const cv::Mat& templateImage, const cv::Mat& testImage, const RegistrationConfig& config) {
	const cv::Mat templateGray = toGray(templateImage);
	const cv::Mat testGray     = toGray(testImage);

	const cv::Ptr<cv::ORB> orb = cv::ORB::create(config.orbNFeatures);
	std::vector<cv::KeyPoint> templateKeypoints, testKeypoints;
	cv::Mat templateDescriptors, testDescriptors;
	orb->detectAndCompute(templateGray, cv::noArray(), templateKeypoints, templateDescriptors);
	orb->detectAndCompute(testGray, cv::noArray(), testKeypoints, testDescriptors);

	if (templateDescriptors.empty() || testDescriptors.empty()) {
		return failure(RegistrationMethod::OrbHomography, RegistrationFailure::MissingDescriptors);
	}

	// Test descriptors are the queries, template descriptors the train set.
	cv::BFMatcher matcher(cv::NORM_HAMMING, false);
	std::vector<std::vector<cv::DMatch>> knnMatches;
	matcher.knnMatch(testDescriptors, templateDescriptors, knnMatches, 2);

	std::vector<cv::DMatch> good;
	for (const auto& pair: knnMatches) {
		if (pair.size() == 2u && pair[0].distance < config.knnRatio * pair[1].distance) {
			good.push_back(pair[0]);
		}
	}

	RegistrationResult result = failure(RegistrationMethod::OrbHomography, RegistrationFailure::NotEnoughMatches);
	result.matchesTotal       = static_cast<int>(knnMatches.size());
	result.matchesUsed        = static_cast<int>(good.size());
	if (result.matchesUsed < config.minMatches) {
		return result;
	}

	std::vector<cv::Point2f> src, dst;
	src.reserve(good.size());
	dst.reserve(good.size());
	for (const auto& m: good) {
		src.push_back(testKeypoints[static_cast<std::size_t>(m.queryIdx)].pt);
		dst.push_back(templateKeypoints[static_cast<std::size_t>(m.trainIdx)].pt);
	}

	cv::Mat inlierMask;
	const cv::Mat H = cv::findHomography(src, dst, cv::RANSAC, config.ransacReprojThreshold, inlierMask);
	if (H.empty() || inlierMask.empty()) {
		result.reason = RegistrationFailure::HomographyFailed;
		return result;
	}

	std::vector<cv::Point2f> srcInliers, dstInliers;
	for (int i = 0; i < inlierMask.rows; ++i) {
		if (inlierMask.at<uchar>(i) != 0) {
			srcInliers.push_back(src[static_cast<std::size_t>(i)]);
			dstInliers.push_back(dst[static_cast<std::size_t>(i)]);
		}
	}

	result.inlierRatio = static_cast<double>(srcInliers.size()) / static_cast<double>(good.size());
	if (!srcInliers.empty()) {
		result.reprojectionErrorPx = meanReprojectionError(srcInliers, dstInliers, H);
	}

	if (result.inlierRatio < config.minInlierRatio) {
		result.reason = RegistrationFailure::LowInlierRatio;
		return result;
	}

	result.success    = true;
	result.reason     = std::nullopt;
	result.homography = H.clone();
	return result;
}

RegistrationResult estimateHomographyAxes(const cv::Mat& templateImage, const cv::Mat& testImage, const RegistrationConfig& config, DebugVisualizer* debugger) {
	if (debugger) {
		debugger->beginStage("Axes Registration");
	}

	const auto templateFrame = detectAxisFrame(templateImage, config, debugger);
	const auto testFrame     = detectAxisFrame(testImage, config, debugger);
	if (!templateFrame || !testFrame) {
		return failure(RegistrationMethod::AxesFallback, RegistrationFailure::AxisDetectionFailed);
	}

	// Columns are the scaled axis vectors. The linear part maps the test basis onto the template basis.
	const cv::Matx22d srcBasis(testFrame->horizontal.x * testFrame->horizontalSpan, testFrame->vertical.x * testFrame->verticalSpan,
	                           testFrame->horizontal.y * testFrame->horizontalSpan, testFrame->vertical.y * testFrame->verticalSpan);
	const cv::Matx22d dstBasis(templateFrame->horizontal.x * templateFrame->horizontalSpan, templateFrame->vertical.x * templateFrame->verticalSpan,
	                           templateFrame->horizontal.y * templateFrame->horizontalSpan, templateFrame->vertical.y * templateFrame->verticalSpan);

	if (std::abs(cv::determinant(srcBasis)) < MIN_BASIS_DETERMINANT) {
		return failure(RegistrationMethod::AxesFallback, RegistrationFailure::AxisSingularBasis);
	}

	const cv::Matx22d linear        = dstBasis * srcBasis.inv();
	const cv::Vec2d srcOrigin(testFrame->origin.x, testFrame->origin.y);
	const cv::Vec2d dstOrigin(templateFrame->origin.x, templateFrame->origin.y);
	const cv::Vec2d translation     = dstOrigin - linear * srcOrigin;

	RegistrationResult result{};
	result.success     = true;
	result.method      = RegistrationMethod::AxesFallback;
	result.inlierRatio = 1.0;
	result.homography  = (cv::Mat_<double>(3, 3) << linear(0, 0), linear(0, 1), translation[0], linear(1, 0), linear(1, 1), translation[1], 0.0, 0.0, 1.0);
	return result;
}

RegistrationResult estimateHomographyEcc(const cv::Mat& templateImage, const cv::Mat& testImage, const RegistrationConfig& config) {
	const cv::Mat templateGray = toGray(templateImage);
	const cv::Mat testGray     = toGray(testImage);

	const double sx = static_cast<double>(templateGray.cols) / testGray.cols;
	const double sy = static_cast<double>(templateGray.rows) / testGray.rows;

	cv::Mat testResized;
	cv::resize(testGray, testResized, templateGray.size(), 0.0, 0.0, cv::INTER_LINEAR);

	cv::Mat templateF, testF;
	templateGray.convertTo(templateF, CV_32F, 1.0 / 255.0);
	testResized.convertTo(testF, CV_32F, 1.0 / 255.0);

	const int motion = toOpenCvMotion(config.eccMotion);
	cv::Mat warp     = motion == cv::MOTION_HOMOGRAPHY ? cv::Mat::eye(3, 3, CV_32F) : cv::Mat::eye(2, 3, CV_32F);
	const cv::TermCriteria criteria(cv::TermCriteria::COUNT | cv::TermCriteria::EPS, config.eccIterations, config.eccEps);

	double correlation = 0.0;
	try {
		correlation = cv::findTransformECC(templateF, testF, warp, motion, criteria, cv::noArray(), ECC_GAUSS_FILTER_SIZE);
	} catch (const cv::Exception&) {
		return failure(RegistrationMethod::EccFallback, RegistrationFailure::EccFailed);
	}

	// The ECC warp maps template pixels into the resized test image. Invert it and prepend the resize.
	cv::Mat templateToResized = cv::Mat::eye(3, 3, CV_64F);
	cv::Mat warpRows            = templateToResized.rowRange(0, warp.rows);
	warp.convertTo(warpRows, CV_64F);

	cv::Mat resizedToTemplate;
	if (cv::invert(templateToResized, resizedToTemplate, cv::DECOMP_LU) == 0.0) {
		return failure(RegistrationMethod::EccFallback, RegistrationFailure::EccFailed);
	}

	const cv::Mat scale = (cv::Mat_<double>(3, 3) << sx, 0.0, 0.0, 0.0, sy, 0.0, 0.0, 0.0, 1.0);
	cv::Mat H           = resizedToTemplate * scale;
	H /= H.at<double>(2, 2);

	RegistrationResult result{};
	result.success     = true;
	result.method      = RegistrationMethod::EccFallback;
	result.inlierRatio = correlation;
	result.homography  = H;
	return result;
}

std::vector<RegistrationResult> estimateRegistrationCandidates(const cv::Mat& templateImage, const cv::Mat& testImage, const RegistrationConfig& config,
                                                               DebugVisualizer* debugger) {
	std::vector<RegistrationResult> candidates;
	candidates.push_back(estimateHomographyOrb(templateImage, testImage, config));
	if (config.useAxesFallback) {
		candidates.push_back(estimateHomographyAxes(templateImage, testImage, config, debugger));
	}
	if (config.useEccFallback) {
		candidates.push_back(estimateHomographyEcc(templateImage, testImage, config));
	}
	return candidates;
}

Contour warpPoints(const Contour& points, const cv::Mat& homography) {
	if (points.empty()) {
		return {};
	}
	CV_Assert(homography.rows == 3 && homography.cols == 3);

	Contour warped;
	cv::perspectiveTransform(points, warped, homography);
	return warped;
}

} // namespace cutprec::precision::core
