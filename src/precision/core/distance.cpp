#include "precision/core/distance.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

#include <opencv2/flann.hpp>
#include <opencv2/imgproc.hpp>

namespace cutprec::precision::core {

namespace {

//! Number of query points handled per brute force block.
static constexpr std::size_t BRUTE_FORCE_CHUNK = 512u;

static cv::Mat toFeatureMatrix(const Contour& points) {
	cv::Mat features(static_cast<int>(points.size()), 2, CV_32F);
	for (int i = 0; i < features.rows; ++i) {
		features.at<float>(i, 0) = points[static_cast<std::size_t>(i)].x;
		features.at<float>(i, 1) = points[static_cast<std::size_t>(i)].y;
	}
	return features;
}

static std::pair<float, float> clampedPosition(const cv::Mat& map, const cv::Point2f& p) {
	const float x = std::clamp(p.x, 0.0f, static_cast<float>(map.cols - 1));
	const float y = std::clamp(p.y, 0.0f, static_cast<float>(map.rows - 1));
	return {x, y};
}

} // namespace

const char* toString(ValidationStatus status) {
	switch (status) {
	case ValidationStatus::Ok:
		return "ok";
	case ValidationStatus::Mismatch:
		return "mismatch";
	case ValidationStatus::InvalidInputs:
		return "invalid_inputs";
	case ValidationStatus::Disabled:
		return "disabled";
	}
	return "unknown";
}

cv::Mat buildDistanceTransform(cv::Size size, const Contour& idealPoints, int drawThickness) {
	CV_Assert(size.width > 0 && size.height > 0);

	cv::Mat mask(size, CV_8UC1, cv::Scalar(255));

	std::vector<cv::Point> polyline;
	polyline.reserve(idealPoints.size());
	for (const auto& p: idealPoints) {
		polyline.emplace_back(static_cast<int>(std::lround(p.x)), static_cast<int>(std::lround(p.y)));
	}
	// Solid 8-connected outline. Anti-aliasing would leave no exact zero pixels for thin lines.
	cv::polylines(mask, std::vector<std::vector<cv::Point>>{polyline}, true, cv::Scalar(0), std::max(1, drawThickness), cv::LINE_8);

	cv::Mat distance;
	cv::distanceTransform(mask, distance, cv::DIST_L2, cv::DIST_MASK_PRECISE, CV_32F);
	return distance;
}

std::vector<double> sampleDistanceMapBilinear(const cv::Mat& distanceMap, const Contour& points) {
	CV_Assert(distanceMap.type() == CV_32FC1 && !distanceMap.empty());

	std::vector<double> values;
	values.reserve(points.size());

	for (const auto& p: points) {
		const auto [x, y] = clampedPosition(distanceMap, p);

		const int x0 = static_cast<int>(std::floor(x));
		const int y0 = static_cast<int>(std::floor(y));
		const int x1 = std::min(x0 + 1, distanceMap.cols - 1);
		const int y1 = std::min(y0 + 1, distanceMap.rows - 1);
		const double wx = x - static_cast<float>(x0);
		const double wy = y - static_cast<float>(y0);

		const double top    = (1.0 - wx) * distanceMap.at<float>(y0, x0) + wx * distanceMap.at<float>(y0, x1);
		const double bottom = (1.0 - wx) * distanceMap.at<float>(y1, x0) + wx * distanceMap.at<float>(y1, x1);
		values.push_back((1.0 - wy) * top + wy * bottom);
	}
	return values;
}

std::vector<double> sampleDistanceMapNearest(const cv::Mat& distanceMap, const Contour& points) {
	CV_Assert(distanceMap.type() == CV_32FC1 && !distanceMap.empty());

	std::vector<double> values;
	values.reserve(points.size());

	for (const auto& p: points) {
		const auto [x, y] = clampedPosition(distanceMap, p);
		values.push_back(distanceMap.at<float>(static_cast<int>(std::lround(y)), static_cast<int>(std::lround(x))));
	}
	return values;
}

std::vector<double> nearestNeighborDistancesBruteForce(const Contour& query, const Contour& reference) {
	if (reference.empty()) {
		throw std::invalid_argument("Reference point set is empty");
	}

	std::vector<double> distances(query.size(), std::numeric_limits<double>::infinity());
	for (std::size_t start = 0; start < query.size(); start += BRUTE_FORCE_CHUNK) {
		const std::size_t end = std::min(start + BRUTE_FORCE_CHUNK, query.size());
		for (const auto& r: reference) {
			for (std::size_t i = start; i < end; ++i) {
				const double dx = static_cast<double>(query[i].x) - r.x;
				const double dy = static_cast<double>(query[i].y) - r.y;
				distances[i]    = std::min(distances[i], dx * dx + dy * dy);
			}
		}
		for (std::size_t i = start; i < end; ++i) {
			distances[i] = std::sqrt(distances[i]);
		}
	}
	return distances;
}

std::vector<double> nearestNeighborDistances(const Contour& query, const Contour& reference) {
	if (reference.empty()) {
		throw std::invalid_argument("Reference point set is empty");
	}
	if (query.empty()) {
		return {};
	}

	const cv::Mat features = toFeatureMatrix(reference);
	const cv::Mat queries  = toFeatureMatrix(query);

	cv::Mat indices;
	cv::Mat squaredDistances;
	try {
		cv::flann::Index index(features, cv::flann::KDTreeIndexParams(1));
		// Unlimited checks turn the approximate search into an exact one.
		index.knnSearch(queries, indices, squaredDistances, 1, cv::flann::SearchParams(-1));
	} catch (const cv::Exception&) {
		return nearestNeighborDistancesBruteForce(query, reference);
	}

	std::vector<double> distances;
	distances.reserve(query.size());
	for (int i = 0; i < squaredDistances.rows; ++i) {
		distances.push_back(std::sqrt(std::max(0.0f, squaredDistances.at<float>(i, 0))));
	}
	return distances;
}

DistanceValidation validateDistanceMethods(const std::vector<double>& rasterDistances, const std::vector<double>& treeDistances, double tolerancePx) {
	if (rasterDistances.empty() || rasterDistances.size() != treeDistances.size()) {
		return {ValidationStatus::InvalidInputs, std::nullopt};
	}

	double sum = 0.0;
	for (std::size_t i = 0; i < rasterDistances.size(); ++i) {
		sum += std::abs(rasterDistances[i] - treeDistances[i]);
	}
	const double meanAbsDelta = sum / static_cast<double>(rasterDistances.size());

	return {meanAbsDelta <= tolerancePx ? ValidationStatus::Ok : ValidationStatus::Mismatch, meanAbsDelta};
}

} // namespace cutprec::precision::core
