#include "axisFrame.hpp"

#include "statistics.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <numbers>
#include <vector>

#include <opencv2/imgproc.hpp>

namespace cutprec::precision::core {

namespace {

//! Lower bound for the Hough accumulator threshold of axis segments.
static constexpr int MIN_AXIS_HOUGH_THRESHOLD = 30;

struct Line {
	cv::Point2d point;
	cv::Point2d direction; //!< Unit length.
};

static double toDegrees(double rad) {
	return rad * 180.0 / std::numbers::pi;
}

static double toRadians(double deg) {
	return deg * std::numbers::pi / 180.0;
}

static cv::Point2d center(const cv::Vec4i& s) {
	return {0.5 * (s[0] + s[2]), 0.5 * (s[1] + s[3])};
}

//! Total least squares line through all segment endpoints.
static std::optional<Line> fitAxisLine(const std::vector<cv::Vec4i>& segments) {
	std::vector<cv::Point2f> endpoints;
	endpoints.reserve(2 * segments.size());
	for (const auto& s: segments) {
		endpoints.emplace_back(static_cast<float>(s[0]), static_cast<float>(s[1]));
		endpoints.emplace_back(static_cast<float>(s[2]), static_cast<float>(s[3]));
	}
	if (endpoints.size() < 2u) {
		return std::nullopt;
	}

	cv::Vec4f fitted;
	cv::fitLine(endpoints, fitted, cv::DIST_L2, 0, 0.01, 0.01);

	const cv::Point2d direction(fitted[0], fitted[1]);
	const double norm = std::hypot(direction.x, direction.y);
	if (norm < 1e-8) {
		return std::nullopt;
	}
	return Line{cv::Point2d(fitted[2], fitted[3]), direction / norm};
}

static std::optional<cv::Point2d> intersect(const Line& a, const Line& b) {
	const double cross = a.direction.x * b.direction.y - a.direction.y * b.direction.x;
	if (std::abs(cross) < 1e-9) {
		return std::nullopt;
	}
	const cv::Point2d delta = b.point - a.point;
	const double s          = (delta.x * b.direction.y - delta.y * b.direction.x) / cross;
	return a.point + s * a.direction;
}

//! Robust distance from the origin to the far end of the axis along its direction.
static double axisSpan(const cv::Point2d& origin, const cv::Point2d& axis, const std::vector<cv::Vec4i>& segments) {
	std::vector<double> projections;
	projections.reserve(2 * segments.size());
	for (const auto& s: segments) {
		projections.push_back(std::abs((cv::Point2d(s[0], s[1]) - origin).dot(axis)));
		projections.push_back(std::abs((cv::Point2d(s[2], s[3]) - origin).dot(axis)));
	}
	return projections.empty() ? 0.0 : percentile(std::move(projections), 95.0);
}

} // namespace

std::optional<AxisFrame> detectAxisFrame(const cv::Mat& image, const RegistrationConfig& config, DebugVisualizer* debugger) {
	cv::Mat gray;
	if (image.channels() == 1) {
		gray = image;
	} else {
		cv::cvtColor(image, gray, image.channels() == 4 ? cv::COLOR_BGRA2GRAY : cv::COLOR_BGR2GRAY);
	}

	cv::Mat blurred, edges;
	cv::GaussianBlur(gray, blurred, cv::Size(5, 5), 0);
	cv::Canny(blurred, edges, config.axesCannyLow, config.axesCannyHigh);

	const int maxDim        = std::max(edges.rows, edges.cols);
	const double minLength  = static_cast<double>(static_cast<int>(maxDim * config.axesSegmentMinLineRatio));
	const int houghThreshold = std::max(MIN_AXIS_HOUGH_THRESHOLD, static_cast<int>(std::lround(0.5 * config.axesHoughThreshold)));

	std::vector<cv::Vec4i> segments;
	cv::HoughLinesP(edges, segments, 1.0, CV_PI / 180.0, houghThreshold, minLength, config.axesMaxLineGap);

	if (debugger) {
		debugger->add("Axis Edges", edges);
	}
	if (segments.empty()) {
		return std::nullopt;
	}

	const double tol = config.axesAngleToleranceDeg;
	std::vector<cv::Vec4i> horizontals, verticals;
	for (const auto& s: segments) {
		const double angle    = toDegrees(std::atan2(static_cast<double>(s[3] - s[1]), static_cast<double>(s[2] - s[0])));
		const double angleAbs = std::fmod(angle + 180.0, 180.0);
		if (angleAbs <= tol || angleAbs >= 180.0 - tol) {
			horizontals.push_back(s);
		}
		if (std::abs(angleAbs - 90.0) <= tol) {
			verticals.push_back(s);
		}
	}
	if (horizontals.empty() || verticals.empty()) {
		return std::nullopt;
	}

	// Reference axes sit at the bottom (horizontal) and the left (vertical). Only narrow the sets if the region has candidates.
	const double minY = config.axesHorizontalRoiMinYRatio * edges.rows;
	const double maxX = config.axesVerticalRoiMaxXRatio * edges.cols;

	std::vector<cv::Vec4i> horizontalRoi, verticalRoi;
	std::copy_if(horizontals.begin(), horizontals.end(), std::back_inserter(horizontalRoi), [&](const cv::Vec4i& s) { return center(s).y >= minY; });
	std::copy_if(verticals.begin(), verticals.end(), std::back_inserter(verticalRoi), [&](const cv::Vec4i& s) { return center(s).x <= maxX; });
	if (!horizontalRoi.empty()) {
		horizontals = std::move(horizontalRoi);
	}
	if (!verticalRoi.empty()) {
		verticals = std::move(verticalRoi);
	}

	auto horizontalLine = fitAxisLine(horizontals);
	auto verticalLine   = fitAxisLine(verticals);
	if (!horizontalLine || !verticalLine) {
		return std::nullopt;
	}

	const auto origin = intersect(*horizontalLine, *verticalLine);
	if (!origin) {
		return std::nullopt;
	}

	// Canonical orientation: horizontal axis points right, vertical axis points up.
	if (horizontalLine->direction.x < 0.0) {
		horizontalLine->direction = -horizontalLine->direction;
	}
	if (verticalLine->direction.y > 0.0) {
		verticalLine->direction = -verticalLine->direction;
	}

	const double orthogonality = std::abs(horizontalLine->direction.dot(verticalLine->direction));
	if (orthogonality > std::cos(toRadians(std::max(1.0, 90.0 - tol)))) {
		return std::nullopt;
	}

	AxisFrame frame{};
	frame.origin         = *origin;
	frame.horizontal     = horizontalLine->direction;
	frame.vertical       = verticalLine->direction;
	frame.horizontalSpan = axisSpan(frame.origin, frame.horizontal, horizontals);
	frame.verticalSpan   = axisSpan(frame.origin, frame.vertical, verticals);

	if (frame.horizontalSpan <= 1.0 || frame.verticalSpan <= 1.0) {
		return std::nullopt;
	}

	if (debugger) {
		cv::Mat vis;
		cv::cvtColor(edges, vis, cv::COLOR_GRAY2BGR);
		cv::line(vis, frame.origin, frame.origin + frame.horizontalSpan * frame.horizontal, cv::Scalar(0, 0, 255), 2, cv::LINE_AA);
		cv::line(vis, frame.origin, frame.origin + frame.verticalSpan * frame.vertical, cv::Scalar(0, 255, 0), 2, cv::LINE_AA);
		debugger->add("Axis Frame", vis);
	}

	return frame;
}

} // namespace cutprec::precision::core
