#include "precision/tau/tauExport.hpp"

#include <algorithm>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <fmt/format.h>

namespace cutprec::precision::tau {

namespace {

static constexpr int PANEL_W  = 900;
static constexpr int PANEL_H  = 600;
static constexpr int MARGIN_L = 70;
static constexpr int MARGIN_R = 20;
static constexpr int MARGIN_T = 60;
static constexpr int MARGIN_B = 60;

static const cv::Scalar BG(255, 255, 255);
static const cv::Scalar AXIS(60, 60, 60);
static const cv::Scalar GRID(230, 230, 230);
static const cv::Scalar BLUE(180, 119, 31);
static const cv::Scalar GREEN(44, 160, 44);
static const cv::Scalar RED(40, 39, 214);
static const cv::Scalar BLACK(17, 17, 17);

struct Series {
	std::vector<double> values;
	cv::Scalar color;
	int thickness;
	std::string label;
};

//! Maps data coordinates into a panel.
struct PlotArea {
	cv::Rect rect;
	double xMin, xMax, yMin, yMax;

	cv::Point toPixel(double x, double y) const {
		const double fx = xMax > xMin ? (x - xMin) / (xMax - xMin) : 0.5;
		const double fy = yMax > yMin ? (y - yMin) / (yMax - yMin) : 0.5;
		return {rect.x + static_cast<int>(std::lround(fx * rect.width)), rect.y + rect.height - static_cast<int>(std::lround(fy * rect.height))};
	}
};

static void drawPanel(cv::Mat& panel, const std::string& title, const std::string& yLabel, const std::vector<double>& taus, const std::vector<Series>& series,
                      double yMax, double bestTau, std::optional<double> hLine) {
	panel.setTo(BG);
	const PlotArea area{cv::Rect(MARGIN_L, MARGIN_T, panel.cols - MARGIN_L - MARGIN_R, panel.rows - MARGIN_T - MARGIN_B), taus.front(), taus.back(), 0.0, yMax};

	for (int i = 0; i <= 4; ++i) {
		const double y = yMax * i / 4.0;
		cv::line(panel, area.toPixel(area.xMin, y), area.toPixel(area.xMax, y), GRID, 1);
		cv::putText(panel, fmt::format("{:.2f}", y), area.toPixel(area.xMin, y) + cv::Point(-60, 5), cv::FONT_HERSHEY_SIMPLEX, 0.4, AXIS, 1, cv::LINE_AA);
	}
	cv::rectangle(panel, area.rect, AXIS, 1);

	if (hLine) {
		cv::line(panel, area.toPixel(area.xMin, *hLine), area.toPixel(area.xMax, *hLine), AXIS, 1, cv::LINE_AA);
	}
	cv::line(panel, area.toPixel(bestTau, 0.0), area.toPixel(bestTau, yMax), BLACK, 1, cv::LINE_AA);

	for (std::size_t s = 0; s < series.size(); ++s) {
		std::vector<cv::Point> polyline;
		for (std::size_t i = 0; i < taus.size(); ++i) {
			polyline.push_back(area.toPixel(taus[i], series[s].values[i]));
		}
		cv::polylines(panel, std::vector<std::vector<cv::Point>>{polyline}, false, series[s].color, series[s].thickness, cv::LINE_AA);

		const cv::Point legend(area.rect.x + 10, area.rect.y + 20 + static_cast<int>(s) * 20);
		cv::line(panel, legend, legend + cv::Point(24, 0), series[s].color, 2, cv::LINE_AA);
		cv::putText(panel, series[s].label, legend + cv::Point(30, 5), cv::FONT_HERSHEY_SIMPLEX, 0.45, AXIS, 1, cv::LINE_AA);
	}

	cv::putText(panel, title, cv::Point(MARGIN_L, 35), cv::FONT_HERSHEY_SIMPLEX, 0.7, BLACK, 1, cv::LINE_AA);
	cv::putText(panel, yLabel, cv::Point(8, MARGIN_T - 10), cv::FONT_HERSHEY_SIMPLEX, 0.45, AXIS, 1, cv::LINE_AA);
	cv::putText(panel, fmt::format("tau {:.4f} .. {:.4f}   best {:.4f}", area.xMin, area.xMax, bestTau), cv::Point(MARGIN_L, panel.rows - 20),
	            cv::FONT_HERSHEY_SIMPLEX, 0.5, AXIS, 1, cv::LINE_AA);
}

static void ensureParent(const std::filesystem::path& path) {
	if (path.has_parent_path()) {
		std::filesystem::create_directories(path.parent_path());
	}
}

} // namespace

std::filesystem::path writeTauCurveCsv(const std::filesystem::path& path, const TauCurve& curve) {
	ensureParent(path);
	std::ofstream out(path);
	if (!out) {
		throw std::runtime_error("Could not write tau curve artifact: " + path.string());
	}

	out << "tau,threshold_ratio,balanced_accuracy,tpr,tnr,mean_ipn_good,mean_ipn_bad,mean_ipn_gap,tp,fn,tn,fp\n";
	for (const auto& p: curve.points) {
		out << fmt::format("{},{},{},{},{},{},{},{},{},{},{},{}\n", p.tau, p.thresholdRatio, p.balancedAccuracy, p.tpr, p.tnr, p.meanIpnGood, p.meanIpnBad,
		                   p.meanIpnGap, p.tp, p.fn, p.tn, p.fp);
	}
	if (!out) {
		throw std::runtime_error("Could not write tau curve artifact: " + path.string());
	}
	return std::filesystem::absolute(path);
}

std::filesystem::path writeTauCurvePng(const std::filesystem::path& path, const TauCurve& curve, double bestTau) {
	if (curve.points.empty()) {
		throw std::invalid_argument("Tau curve has no points");
	}

	std::vector<double> taus, balanced, tpr, tnr, ipnGood, ipnBad;
	for (const auto& p: curve.points) {
		taus.push_back(p.tau);
		balanced.push_back(p.balancedAccuracy);
		tpr.push_back(p.tpr);
		tnr.push_back(p.tnr);
		ipnGood.push_back(p.meanIpnGood);
		ipnBad.push_back(p.meanIpnBad);
	}

	cv::Mat canvas(PANEL_H, 2 * PANEL_W, CV_8UC3, BG);
	cv::Mat left  = canvas(cv::Rect(0, 0, PANEL_W, PANEL_H));
	cv::Mat right = canvas(cv::Rect(PANEL_W, 0, PANEL_W, PANEL_H));

	drawPanel(left, fmt::format("Classification metrics ({})", toString(curve.units)), "score", taus,
	          {{balanced, BLUE, 2, "Balanced accuracy"}, {tpr, GREEN, 1, "TPR"}, {tnr, RED, 1, "TNR"}}, 1.02, bestTau, std::nullopt);
	drawPanel(right, fmt::format("Mean IPN by class (accept_ipn={:.1f})", curve.acceptIpn), "IPN", taus,
	          {{ipnGood, GREEN, 2, "Mean IPN (good)"}, {ipnBad, RED, 2, "Mean IPN (bad)"}}, 100.0, bestTau, curve.acceptIpn);

	ensureParent(path);
	if (!cv::imwrite(path.string(), canvas)) {
		throw std::runtime_error("Could not write tau curve artifact: " + path.string());
	}
	return std::filesystem::absolute(path);
}

} // namespace cutprec::precision::tau
