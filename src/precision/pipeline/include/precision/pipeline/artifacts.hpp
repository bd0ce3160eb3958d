#pragma once

#include "precision/core/contour.hpp"

#include <nlohmann/json.hpp>
#include <opencv2/core/mat.hpp>

#include <filesystem>
#include <optional>
#include <vector>

namespace cutprec::precision::pipeline {

//! Load a 3 channel 8 bit image. Throws std::runtime_error("Could not load image: <path>").
cv::Mat readBgrImage(const std::filesystem::path& path);

//! Write an image, creating the parent directory. Throws std::runtime_error if encoding or writing fails.
void writeImage(const std::filesystem::path& path, const cv::Mat& image);

//! Ideal outline in green and registered real outline in red on top of the template.
void writeOverlay(const std::filesystem::path& path, const cv::Mat& background, const core::Contour& idealPoints, const core::Contour& realPoints);

//! Real points colored by their distance on a dimmed template, with a color bar.
void writeErrorMap(const std::filesystem::path& path, const cv::Mat& background, const core::Contour& points, const std::vector<double>& distances);

//! Histogram of the distances (40 bins).
void writeErrorHistogram(const std::filesystem::path& path, const std::vector<double>& distances);

//! Per point distances as CSV: idx,x,y,d_px,d_mm. d_mm stays empty without calibration.
void writeDistancesCsv(const std::filesystem::path& path, const core::Contour& points, const std::vector<double>& distancesPx,
                       std::optional<double> mmPerPx);

//! Pretty printed JSON document. Throws std::runtime_error if the file cannot be written.
void writeJson(const std::filesystem::path& path, const nlohmann::json& document);

} // namespace cutprec::precision::pipeline
