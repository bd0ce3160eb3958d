#pragma once

#include "precision/core/contour.hpp"

#include <opencv2/core/mat.hpp>

#include <optional>
#include <vector>

namespace cutprec::precision::core {

enum class ValidationStatus { Ok, Mismatch, InvalidInputs, Disabled };

const char* toString(ValidationStatus status);

//! Agreement between the raster and the tree based distances.
struct DistanceValidation {
	ValidationStatus status{ValidationStatus::Disabled};
	std::optional<double> meanAbsDeltaPx{}; //!< Mean |raster - tree|. Absent for InvalidInputs and Disabled.
};

//! Euclidean distance to the closest contour pixel for every pixel of an image of the given size.
//! \param [in] size          Size of the raster.
//! \param [in] idealPoints   Closed outline drawn into the raster.
//! \param [in] drawThickness Line thickness of the drawn outline, at least 1.
//! \return     CV_32FC1 map, zero on the outline.
cv::Mat buildDistanceTransform(cv::Size size, const Contour& idealPoints, int drawThickness = 1);

//! Bilinear interpolation of the map at sub-pixel positions. Coordinates are clamped to the raster.
std::vector<double> sampleDistanceMapBilinear(const cv::Mat& distanceMap, const Contour& points);

//! Rounds every position to the nearest pixel. Coordinates are clamped to the raster.
std::vector<double> sampleDistanceMapNearest(const cv::Mat& distanceMap, const Contour& points);

//! Exact Euclidean distance from each query point to its nearest reference point.
//! Uses a k-d tree searched without check limit. Falls back to chunked brute force if the index cannot be built.
//! \throws std::invalid_argument if the reference set is empty.
std::vector<double> nearestNeighborDistances(const Contour& query, const Contour& reference);

//! Brute force variant of nearestNeighborDistances, processed in chunks of queries to bound memory.
std::vector<double> nearestNeighborDistancesBruteForce(const Contour& query, const Contour& reference);

//! Compare the two distance arrays. InvalidInputs on empty or different lengths.
DistanceValidation validateDistanceMethods(const std::vector<double>& rasterDistances, const std::vector<double>& treeDistances, double tolerancePx = 1.5);

} // namespace cutprec::precision::core
