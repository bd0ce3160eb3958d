#include "precision/core/contourExtractor.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <vector>

#include <opencv2/imgproc.hpp>

namespace cutprec::precision::core {

namespace {

//! Penalty per pixel of centroid distance from the image center.
static constexpr double CENTER_DISTANCE_WEIGHT = 1.5;
//! Fraction of the area subtracted from components touching the image border.
static constexpr double BORDER_AREA_PENALTY = 0.5;
//! Accumulator threshold of the long line detector.
static constexpr int LINE_HOUGH_THRESHOLD = 80;
static constexpr double LINE_MAX_GAP      = 10.0;

static cv::Mat ellipseKernel(int size) {
	const int k = std::max(1, size);
	return cv::getStructuringElement(cv::MORPH_ELLIPSE, cv::Size(k, k));
}

//! Convert image to grayscale independent of channel format.
static cv::Mat toGray(const cv::Mat& image) {
	cv::Mat gray;
	if (image.channels() == 1) {
		gray = image.clone();
	} else if (image.channels() == 4) {
		cv::cvtColor(image, gray, cv::COLOR_BGRA2GRAY);
	} else {
		cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
	}
	return gray;
}

static cv::Mat toBgr(const cv::Mat& image) {
	cv::Mat bgr;
	if (image.channels() == 1) {
		cv::cvtColor(image, bgr, cv::COLOR_GRAY2BGR);
	} else if (image.channels() == 4) {
		cv::cvtColor(image, bgr, cv::COLOR_BGRA2BGR);
	} else {
		bgr = image;
	}
	return bgr;
}

//! Erase long straight segments (frames, dimension lines) from a binary drawing.
static cv::Mat removeLongLines(const cv::Mat& binary, const ExtractionConfig& config) {
	const double minLength = static_cast<double>(std::max(binary.rows, binary.cols)) * config.lineRemovalMinLengthRatio;

	std::vector<cv::Vec4i> lines;
	cv::HoughLinesP(binary, lines, 1.0, CV_PI / 180.0, LINE_HOUGH_THRESHOLD, minLength, LINE_MAX_GAP);
	if (lines.empty()) {
		return binary.clone();
	}

	cv::Mat lineMask = cv::Mat::zeros(binary.size(), CV_8UC1);
	for (const auto& l: lines) {
		cv::line(lineMask, cv::Point(l[0], l[1]), cv::Point(l[2], l[3]), cv::Scalar(255), std::max(1, config.lineRemovalThickness));
	}

	cv::Mat cleaned = binary.clone();
	cleaned.setTo(0, lineMask);
	return cleaned;
}

//! The longest external contour of a mask.
static Contour longestExternalContour(const cv::Mat& mask) {
	std::vector<std::vector<cv::Point>> contours;
	cv::findContours(mask, contours, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_NONE);
	if (contours.empty()) {
		return {};
	}

	const auto longest = std::max_element(contours.begin(), contours.end(), [](const auto& a, const auto& b) { return a.size() < b.size(); });
	Contour out;
	out.reserve(longest->size());
	for (const auto& p: *longest) {
		out.emplace_back(static_cast<float>(p.x), static_cast<float>(p.y));
	}
	return out;
}

//! The external contour enclosing the largest area.
static Contour largestAreaContour(const cv::Mat& mask) {
	std::vector<std::vector<cv::Point>> contours;
	cv::findContours(mask, contours, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_NONE);
	if (contours.empty()) {
		return {};
	}

	const auto largest =
	        std::max_element(contours.begin(), contours.end(), [](const auto& a, const auto& b) { return cv::contourArea(a) < cv::contourArea(b); });
	Contour out;
	out.reserve(largest->size());
	for (const auto& p: *largest) {
		out.emplace_back(static_cast<float>(p.x), static_cast<float>(p.y));
	}
	return out;
}

static bool touchesBorder(const cv::Mat& stats, int label, cv::Size size) {
	const int x = stats.at<int>(label, cv::CC_STAT_LEFT);
	const int y = stats.at<int>(label, cv::CC_STAT_TOP);
	const int w = stats.at<int>(label, cv::CC_STAT_WIDTH);
	const int h = stats.at<int>(label, cv::CC_STAT_HEIGHT);
	return x <= 1 || y <= 1 || x + w >= size.width - 1 || y + h >= size.height - 1;
}

} // namespace

cv::Mat selectIdealComponentGroup(const cv::Mat& binaryMask, const ExtractionConfig& config) {
	CV_Assert(binaryMask.type() == CV_8UC1);

	cv::Mat labels, stats, centroids;
	const int count = cv::connectedComponentsWithStats(binaryMask, labels, stats, centroids, 8, CV_32S);
	if (count <= 1) {
		return {};
	}

	const cv::Size size = binaryMask.size();
	const cv::Point2d center(size.width / 2.0, size.height / 2.0);
	const double minArea = config.idealMinAreaRatio * static_cast<double>(size.area());

	const auto area            = [&](int label) { return static_cast<double>(stats.at<int>(label, cv::CC_STAT_AREA)); };
	const auto centerDistance  = [&](int label) {
		return std::hypot(centroids.at<double>(label, 0) - center.x, centroids.at<double>(label, 1) - center.y);
	};

	// Anchor: large, central component. Border touching components are penalised (page frames, cropped lines).
	int anchor       = -1;
	double bestScore = -std::numeric_limits<double>::infinity();
	for (int label = 1; label < count; ++label) {
		if (area(label) < minArea) {
			continue;
		}
		double score = area(label) - CENTER_DISTANCE_WEIGHT * centerDistance(label);
		if (touchesBorder(stats, label, size)) {
			score -= BORDER_AREA_PENALTY * area(label);
		}
		if (score > bestScore) {
			bestScore = score;
			anchor    = label;
		}
	}

	if (anchor < 0) {
		anchor = 1;
		for (int label = 2; label < count; ++label) {
			if (area(label) > area(anchor)) {
				anchor = label;
			}
		}
	}

	// Fragments of the same drawing: similar size, near the center, not touching the border.
	const double groupMinArea = config.idealGroupAreaRatioToMax * area(anchor);
	const double groupRadius  = config.idealGroupCenterRadiusRatio * static_cast<double>(std::min(size.width, size.height));

	cv::Mat group = (labels == anchor);
	int members   = 1;
	for (int label = 1; label < count; ++label) {
		if (label == anchor || area(label) < std::max(minArea, groupMinArea)) {
			continue;
		}
		if (touchesBorder(stats, label, size) || centerDistance(label) > groupRadius) {
			continue;
		}
		group.setTo(255, labels == label);
		++members;
	}

	if (members > 1) {
		cv::morphologyEx(group, group, cv::MORPH_CLOSE, ellipseKernel(config.idealGroupCloseKernel));
	}
	return group;
}

ExtractionResult extractIdealContour(const cv::Mat& image, const ExtractionConfig& config, DebugVisualizer* debugger) {
	CV_Assert(!image.empty());

	if (debugger) {
		debugger->beginStage("Extract Ideal");
		debugger->add("Input", image);
	}

	const cv::Mat gray = toGray(image);
	cv::Mat blurred;
	cv::GaussianBlur(gray, blurred, cv::Size(5, 5), 0);

	const int blockSize = config.idealAdaptiveBlockSize % 2 == 0 ? config.idealAdaptiveBlockSize + 1 : config.idealAdaptiveBlockSize;
	cv::Mat binary;
	cv::adaptiveThreshold(blurred, binary, 255, cv::ADAPTIVE_THRESH_GAUSSIAN_C, cv::THRESH_BINARY_INV, std::max(3, blockSize), config.idealAdaptiveC);

	cv::Mat cleaned = removeLongLines(binary, config);
	cv::morphologyEx(cleaned, cleaned, cv::MORPH_CLOSE, ellipseKernel(config.idealCloseKernel));
	cv::dilate(cleaned, cleaned, ellipseKernel(config.idealDilateKernel));

	if (debugger) {
		debugger->add("Adaptive Threshold", binary);
		debugger->add("Lines Removed", cleaned);
	}

	ExtractionResult result{};
	result.binaryMask = binary;

	const cv::Mat group = selectIdealComponentGroup(cleaned, config);
	if (group.empty()) {
		result.cleanedMask = cleaned;
		result.reason      = "no_ideal_contour_found";
		if (debugger) {
			debugger->endStage();
		}
		return result;
	}

	result.cleanedMask = group;
	result.contour     = longestExternalContour(group);
	result.success     = result.contour.size() >= 3u;
	if (!result.success) {
		result.contour.clear();
		result.reason = "no_ideal_contour_found";
	}

	if (debugger) {
		debugger->add("Component Group", group);
		debugger->addContours("Ideal Contour", image, {{result.contour, cv::Scalar(0, 200, 0)}});
		debugger->endStage();
	}

	return result;
}

ExtractionResult extractRealContour(const cv::Mat& image, const ExtractionConfig& config, DebugVisualizer* debugger) {
	CV_Assert(!image.empty());

	if (debugger) {
		debugger->beginStage("Extract Real");
		debugger->add("Input", image);
	}

	const cv::Mat bgr = toBgr(image);
	cv::Mat lab, hsv;
	cv::cvtColor(bgr, lab, cv::COLOR_BGR2Lab);
	cv::cvtColor(bgr, hsv, cv::COLOR_BGR2HSV);

	cv::Mat labChannels[3], hsvChannels[3];
	cv::split(lab, labChannels);
	cv::split(hsv, hsvChannels);

	// Dark part on light paper: either channel below threshold marks the part.
	const cv::Mat darkL = labChannels[0] < config.realLabLThreshold;
	const cv::Mat darkV = hsvChannels[2] < config.realHsvVThreshold;
	cv::Mat binary      = darkL | darkV;

	cv::Mat cleaned;
	cv::morphologyEx(binary, cleaned, cv::MORPH_CLOSE, ellipseKernel(config.realCloseKernel));
	cv::morphologyEx(cleaned, cleaned, cv::MORPH_OPEN, ellipseKernel(config.realOpenKernel));

	// Fill holes: everything not reachable from the corner belongs to the part.
	if (cleaned.at<uchar>(0, 0) == 0) {
		cv::Mat flood = cleaned.clone();
		cv::floodFill(flood, cv::Point(0, 0), cv::Scalar(255));
		cv::Mat holes;
		cv::bitwise_not(flood, holes);
		cleaned = cleaned | holes;
	}

	if (debugger) {
		debugger->add("Dark Mask", binary);
		debugger->add("Filled", cleaned);
	}

	ExtractionResult result{};
	result.binaryMask  = binary;
	result.cleanedMask = cleaned;
	result.contour     = largestAreaContour(cleaned);
	result.success     = result.contour.size() >= 3u;
	if (!result.success) {
		result.contour.clear();
		result.reason = "no_real_contour_found";
	}

	if (debugger) {
		debugger->addContours("Real Contour", image, {{result.contour, cv::Scalar(0, 0, 220)}});
		debugger->endStage();
	}

	return result;
}

} // namespace cutprec::precision::core
