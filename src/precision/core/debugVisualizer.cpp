#include "precision/core/debugVisualizer.hpp"

#include <algorithm>
#include <cmath>
#include <optional>

#include <opencv2/imgproc.hpp>

namespace cutprec::precision::core {

void DebugVisualizer::beginStage(std::string name) {
	if (m_hasActiveStage) {
		endStage();
	}
	m_hasActiveStage    = true;
	m_currentStage.name = std::move(name);
}

void DebugVisualizer::endStage() {
	if (!m_hasActiveStage) {
		return;
	}

	m_stages.emplace_back(std::move(m_currentStage));
	m_currentStage   = DebugStage{};
	m_hasActiveStage = false;
}

void DebugVisualizer::add(std::string name, const cv::Mat& img) {
	if (!m_hasActiveStage) {
		beginStage("");
	}

	m_currentStage.images.push_back(DebugStep{std::move(name), img.clone()});
}

void DebugVisualizer::addContours(std::string name, const cv::Mat& base, const std::vector<ColoredContour>& contours) {
	cv::Mat canvas = toBgr8U(base).clone();

	for (const auto& [contour, color]: contours) {
		if (contour.size() < 2u) {
			continue;
		}
		std::vector<cv::Point> polyline;
		polyline.reserve(contour.size());
		for (const auto& p: contour) {
			polyline.emplace_back(static_cast<int>(std::lround(p.x)), static_cast<int>(std::lround(p.y)));
		}
		cv::polylines(canvas, std::vector<std::vector<cv::Point>>{polyline}, true, color, 2, cv::LINE_AA);
	}

	add(std::move(name), canvas);
}

std::vector<DebugStep> DebugVisualizer::stageImages(const std::string& stageName) const {
	for (const auto& stage: m_stages) {
		if (stage.name == stageName) {
			return stage.images;
		}
	}
	if (m_hasActiveStage && m_currentStage.name == stageName) {
		return m_currentStage.images;
	}
	return {};
}

void DebugVisualizer::clear() {
	m_stages.clear();
	m_currentStage   = DebugStage{};
	m_hasActiveStage = false;
}

//! Scales the image into the cell below its label bar, keeping the aspect ratio.
static void drawTile(cv::Mat& cell, const DebugStep& step, const int labelHeight, const int pad) {
	static const cv::Scalar LABEL_BG(0, 0, 0);
	static const cv::Scalar LABEL_FG(230, 230, 230);

	cv::rectangle(cell, cv::Rect(0, 0, cell.cols, labelHeight), LABEL_BG, cv::FILLED);
	cv::putText(cell, step.name, cv::Point(pad, labelHeight - 8), cv::FONT_HERSHEY_SIMPLEX, 0.5, LABEL_FG, 1, cv::LINE_AA);
	if (step.image.empty()) {
		return;
	}

	const cv::Rect area(pad, labelHeight + pad, std::max(1, cell.cols - 2 * pad), std::max(1, cell.rows - labelHeight - 2 * pad));
	const cv::Mat vis  = DebugVisualizer::toBgr8U(step.image);
	const double scale = std::min(static_cast<double>(area.width) / vis.cols, static_cast<double>(area.height) / vis.rows);
	const cv::Size fitted(std::clamp(static_cast<int>(std::lround(vis.cols * scale)), 1, area.width),
	                      std::clamp(static_cast<int>(std::lround(vis.rows * scale)), 1, area.height));

	cv::Mat resized;
	cv::resize(vis, resized, fitted, 0.0, 0.0, scale < 1.0 ? cv::INTER_AREA : cv::INTER_NEAREST);
	resized.copyTo(cell(cv::Rect(area.x + (area.width - fitted.width) / 2, area.y + (area.height - fitted.height) / 2, fitted.width, fitted.height)));
}

cv::Mat DebugVisualizer::buildMosaic() {
	static constexpr int TILE_WIDTH    = 320;
	static constexpr int TITLE_HEIGHT  = 30;
	static constexpr int LABEL_HEIGHT  = 24;
	static constexpr int TILE_PAD      = 4;
	static constexpr int MAX_WIDTH     = 2400;
	static constexpr double MIN_ASPECT = 0.4;
	static constexpr double MAX_ASPECT = 2.5;

	static const cv::Scalar BACKGROUND(24, 24, 24);
	static const cv::Scalar TITLE_BG(60, 40, 10);
	static const cv::Scalar TITLE_FG(255, 255, 255);

	endStage();

	// Cut images are rarely square, so the tiles follow the aspect ratio of the first image.
	std::optional<double> aspect;
	std::size_t width = 0;
	for (const auto& stage: m_stages) {
		width = std::max(width, stage.images.size());
		if (!aspect && !stage.images.empty() && !stage.images.front().image.empty()) {
			const auto& first = stage.images.front().image;
			aspect            = std::clamp(static_cast<double>(first.cols) / first.rows, MIN_ASPECT, MAX_ASPECT);
		}
	}
	if (width == 0u) {
		return {};
	}

	const int columns    = static_cast<int>(width);
	const int tileWidth  = std::max(1, std::min(TILE_WIDTH, MAX_WIDTH / columns));
	const int tileHeight = LABEL_HEIGHT + static_cast<int>(std::lround(tileWidth / aspect.value_or(1.0)));
	const int bandHeight = TITLE_HEIGHT + tileHeight;

	cv::Mat mosaic(bandHeight * static_cast<int>(m_stages.size()), tileWidth * columns, CV_8UC3, BACKGROUND);

	// One band per stage: a title bar followed by the stage images from left to right.
	for (std::size_t s = 0; s < m_stages.size(); ++s) {
		const auto& stage = m_stages[s];
		const int top     = static_cast<int>(s) * bandHeight;

		cv::Mat title = mosaic(cv::Rect(0, top, mosaic.cols, TITLE_HEIGHT));
		title.setTo(TITLE_BG);
		const std::string stageName = stage.name.empty() ? "Stage " + std::to_string(s + 1) : stage.name;
		cv::putText(title, stageName, cv::Point(8, TITLE_HEIGHT - 9), cv::FONT_HERSHEY_SIMPLEX, 0.7, TITLE_FG, 1, cv::LINE_AA);

		for (std::size_t i = 0; i < stage.images.size(); ++i) {
			cv::Mat cell = mosaic(cv::Rect(static_cast<int>(i) * tileWidth, top + TITLE_HEIGHT, tileWidth, tileHeight));
			drawTile(cell, stage.images[i], LABEL_HEIGHT, TILE_PAD);
		}
	}

	return mosaic;
}

cv::Mat DebugVisualizer::toBgr8U(const cv::Mat& in) {
	// Distance maps and float masks are stretched to the full 8 bit range.
	cv::Mat stretched = in;
	if (in.depth() != CV_8U) {
		cv::normalize(in, stretched, 0.0, 255.0, cv::NORM_MINMAX, CV_8U);
	}

	cv::Mat out;
	switch (stretched.channels()) {
	case 1:
		cv::cvtColor(stretched, out, cv::COLOR_GRAY2BGR);
		break;
	case 4:
		cv::cvtColor(stretched, out, cv::COLOR_BGRA2BGR);
		break;
	default:
		out = stretched;
	}
	return out;
}

} // namespace cutprec::precision::core
