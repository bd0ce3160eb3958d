#include "precision/pipeline/artifacts.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <fstream>
#include <stdexcept>

namespace cutprec::precision::pipeline {

namespace {

static constexpr int HIST_BINS     = 40;
static constexpr int HIST_W        = 800;
static constexpr int HIST_H        = 400;
static constexpr int HIST_MARGIN   = 50;
static constexpr int COLORBAR_W    = 90;
static constexpr double DIM_FACTOR = 0.6;

static void prepareParent(const std::filesystem::path& path) {
	if (path.has_parent_path()) {
		std::filesystem::create_directories(path.parent_path());
	}
}

static std::vector<cv::Point> toPixels(const core::Contour& points) {
	std::vector<cv::Point> pixels;
	pixels.reserve(points.size());
	for (const auto& p: points) {
		pixels.emplace_back(static_cast<int>(std::lround(p.x)), static_cast<int>(std::lround(p.y)));
	}
	return pixels;
}

//! Turbo colors for values in [lo, hi].
static cv::Mat colorize(const std::vector<double>& values, double lo, double hi) {
	cv::Mat scaled(1, static_cast<int>(values.size()), CV_8UC1);
	const double range = hi > lo ? hi - lo : 1.0;
	for (std::size_t i = 0; i < values.size(); ++i) {
		scaled.at<uchar>(0, static_cast<int>(i)) = cv::saturate_cast<uchar>(255.0 * (values[i] - lo) / range);
	}
	cv::Mat colors;
	cv::applyColorMap(scaled, colors, cv::COLORMAP_TURBO);
	return colors;
}

} // namespace

cv::Mat readBgrImage(const std::filesystem::path& path) {
	cv::Mat image = cv::imread(path.string(), cv::IMREAD_COLOR);
	if (image.empty()) {
		throw std::runtime_error(fmt::format("Could not load image: {}", path.string()));
	}
	return image;
}

void writeImage(const std::filesystem::path& path, const cv::Mat& image) {
	prepareParent(path);

	bool written = false;
	try {
		written = cv::imwrite(path.string(), image);
	} catch (const cv::Exception& e) {
		throw std::runtime_error(fmt::format("Could not write image artifact: {} ({})", path.string(), e.what()));
	}
	if (!written) {
		throw std::runtime_error(fmt::format("Could not write image artifact: {}", path.string()));
	}
}

void writeOverlay(const std::filesystem::path& path, const cv::Mat& background, const core::Contour& idealPoints, const core::Contour& realPoints) {
	cv::Mat canvas = background.clone();
	if (!idealPoints.empty()) {
		cv::polylines(canvas, std::vector<std::vector<cv::Point>>{toPixels(idealPoints)}, true, cv::Scalar(0, 255, 0), 2);
	}
	if (!realPoints.empty()) {
		cv::polylines(canvas, std::vector<std::vector<cv::Point>>{toPixels(realPoints)}, true, cv::Scalar(0, 0, 255), 2);
	}
	writeImage(path, canvas);
}

void writeErrorMap(const std::filesystem::path& path, const cv::Mat& background, const core::Contour& points, const std::vector<double>& distances) {
	cv::Mat dimmed;
	background.convertTo(dimmed, -1, DIM_FACTOR, 255.0 * (1.0 - DIM_FACTOR));

	cv::Mat canvas;
	cv::copyMakeBorder(dimmed, canvas, 0, 0, 0, COLORBAR_W, cv::BORDER_CONSTANT, cv::Scalar(255, 255, 255));

	if (points.empty() || distances.empty()) {
		writeImage(path, canvas);
		return;
	}

	const auto [minIt, maxIt] = std::minmax_element(distances.begin(), distances.end());
	const double lo           = *minIt;
	const double hi           = *maxIt;

	const cv::Mat colors = colorize(distances, lo, hi);
	const auto pixels    = toPixels(points);
	for (std::size_t i = 0; i < std::min(pixels.size(), distances.size()); ++i) {
		const auto c = colors.at<cv::Vec3b>(0, static_cast<int>(i));
		cv::circle(canvas, pixels[i], 3, cv::Scalar(c[0], c[1], c[2]), cv::FILLED, cv::LINE_AA);
	}

	// Color bar, high values on top.
	const int barX = background.cols + 15;
	const int barT = 30;
	const int barB = std::max(barT + 10, background.rows - 30);
	std::vector<double> ramp(static_cast<std::size_t>(barB - barT));
	for (std::size_t i = 0; i < ramp.size(); ++i) {
		ramp[i] = hi - (hi - lo) * static_cast<double>(i) / static_cast<double>(ramp.size() - 1);
	}
	const cv::Mat rampColors = colorize(ramp, lo, hi);
	for (int i = 0; i < static_cast<int>(ramp.size()); ++i) {
		const auto c = rampColors.at<cv::Vec3b>(0, i);
		cv::line(canvas, {barX, barT + i}, {barX + 20, barT + i}, cv::Scalar(c[0], c[1], c[2]));
	}
	cv::putText(canvas, fmt::format("{:.2f}", hi), {barX, barT - 8}, cv::FONT_HERSHEY_SIMPLEX, 0.4, cv::Scalar(40, 40, 40), 1, cv::LINE_AA);
	cv::putText(canvas, fmt::format("{:.2f}", lo), {barX, barB + 16}, cv::FONT_HERSHEY_SIMPLEX, 0.4, cv::Scalar(40, 40, 40), 1, cv::LINE_AA);
	cv::putText(canvas, "px", {barX + 25, (barT + barB) / 2}, cv::FONT_HERSHEY_SIMPLEX, 0.4, cv::Scalar(40, 40, 40), 1, cv::LINE_AA);

	writeImage(path, canvas);
}

void writeErrorHistogram(const std::filesystem::path& path, const std::vector<double>& distances) {
	cv::Mat canvas(HIST_H, HIST_W, CV_8UC3, cv::Scalar(255, 255, 255));
	const cv::Rect area(HIST_MARGIN, HIST_MARGIN, HIST_W - 2 * HIST_MARGIN, HIST_H - 2 * HIST_MARGIN);

	cv::putText(canvas, "Distance Distribution", {HIST_W / 2 - 90, 30}, cv::FONT_HERSHEY_SIMPLEX, 0.6, cv::Scalar(20, 20, 20), 1, cv::LINE_AA);
	cv::putText(canvas, "Distance (px)", {HIST_W / 2 - 50, HIST_H - 12}, cv::FONT_HERSHEY_SIMPLEX, 0.45, cv::Scalar(60, 60, 60), 1, cv::LINE_AA);

	if (!distances.empty()) {
		const auto [minIt, maxIt] = std::minmax_element(distances.begin(), distances.end());
		const double lo           = *minIt;
		const double width        = *maxIt > lo ? (*maxIt - lo) / HIST_BINS : 1.0;

		std::vector<int> counts(HIST_BINS, 0);
		for (double d: distances) {
			const int bin = std::clamp(static_cast<int>((d - lo) / width), 0, HIST_BINS - 1);
			++counts[bin];
		}
		const int peak = *std::max_element(counts.begin(), counts.end());

		const double binPx = static_cast<double>(area.width) / HIST_BINS;
		for (int b = 0; b < HIST_BINS; ++b) {
			const int h = static_cast<int>(std::lround(static_cast<double>(counts[b]) / peak * area.height));
			const cv::Rect bar(area.x + static_cast<int>(b * binPx), area.y + area.height - h, static_cast<int>(std::ceil(binPx)), h);
			cv::rectangle(canvas, bar, cv::Scalar(180, 119, 31), cv::FILLED);
			cv::rectangle(canvas, bar, cv::Scalar(255, 255, 255), 1);
		}

		cv::putText(canvas, fmt::format("{:.2f}", lo), {area.x, area.y + area.height + 18}, cv::FONT_HERSHEY_SIMPLEX, 0.4, cv::Scalar(60, 60, 60), 1,
		            cv::LINE_AA);
		cv::putText(canvas, fmt::format("{:.2f}", *maxIt), {area.x + area.width - 40, area.y + area.height + 18}, cv::FONT_HERSHEY_SIMPLEX, 0.4,
		            cv::Scalar(60, 60, 60), 1, cv::LINE_AA);
		cv::putText(canvas, fmt::format("{}", peak), {8, area.y + 5}, cv::FONT_HERSHEY_SIMPLEX, 0.4, cv::Scalar(60, 60, 60), 1, cv::LINE_AA);
	}
	cv::rectangle(canvas, area, cv::Scalar(60, 60, 60), 1);

	writeImage(path, canvas);
}

void writeDistancesCsv(const std::filesystem::path& path, const core::Contour& points, const std::vector<double>& distancesPx,
                       std::optional<double> mmPerPx) {
	if (points.size() != distancesPx.size()) {
		throw std::invalid_argument("points and distances must have the same length");
	}
	prepareParent(path);

	std::ofstream out(path);
	if (!out) {
		throw std::runtime_error(fmt::format("Could not write distances artifact: {}", path.string()));
	}

	out << "idx,x,y,d_px,d_mm\n";
	for (std::size_t i = 0; i < points.size(); ++i) {
		const double dPx = distancesPx[i];
		out << fmt::format("{},{},{},{},", i, points[i].x, points[i].y, dPx);
		if (mmPerPx) {
			out << fmt::format("{}", dPx * *mmPerPx);
		}
		out << '\n';
	}

	if (!out) {
		throw std::runtime_error(fmt::format("Could not write distances artifact: {}", path.string()));
	}
}

void writeJson(const std::filesystem::path& path, const nlohmann::json& document) {
	prepareParent(path);

	std::ofstream out(path);
	if (!out) {
		throw std::runtime_error(fmt::format("Could not write report artifact: {}", path.string()));
	}
	out << document.dump(2) << '\n';
	if (!out) {
		throw std::runtime_error(fmt::format("Could not write report artifact: {}", path.string()));
	}
}

} // namespace cutprec::precision::pipeline
