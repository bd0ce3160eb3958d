#include "analyser.hpp"

#include "precision/core/contourExtractor.hpp"
#include "precision/core/debugVisualizer.hpp"
#include "precision/core/measurement.hpp"
#include "precision/core/registration.hpp"
#include "precision/core/registrationSelector.hpp"
#include "precision/core/resampler.hpp"

#include <fmt/format.h>
#include <opencv2/imgproc.hpp>

#include <exception>
#include <string>
#include <utility>

namespace cutprec::precision {

static cv::Mat buildInfoTile(const std::string& title, const std::string& message) {
	cv::Mat tile(540, 960, CV_8UC3, cv::Scalar(20, 20, 20));
	cv::putText(tile, title, cv::Point(40, 120), cv::FONT_HERSHEY_SIMPLEX, 1.1, cv::Scalar(250, 250, 250), 2, cv::LINE_AA);
	cv::putText(tile, message, cv::Point(40, 200), cv::FONT_HERSHEY_SIMPLEX, 0.85, cv::Scalar(200, 200, 200), 2, cv::LINE_AA);
	return tile;
}

//! Real contour warped by every candidate, drawn over the template next to the ideal contour.
static void addCandidateOverlays(core::DebugVisualizer& debugger, const cv::Mat& templateImage, const core::RegistrationSelection& selection,
                                 const core::Contour& idealPoints, const core::Contour& realContour) {
	debugger.beginStage("Registration Candidates");
	for (const auto& row: selection.candidates) {
		const auto warped    = core::warpPoints(realContour, row.result.homography);
		const auto method    = std::string(core::toString(row.result.method));
		const auto mad       = row.selectionMadPx ? fmt::format("{:.2f}px", *row.selectionMadPx) : std::string("failed");
		const cv::Scalar red = row.result.success ? cv::Scalar(0, 0, 220) : cv::Scalar(0, 140, 255);
		debugger.addContours(fmt::format("{} ({})", method, mad), templateImage, {{idealPoints, cv::Scalar(0, 200, 0)}, {warped, red}});
	}
	debugger.endStage();
}

Analyser::Analyser(cv::Mat templateImage, cv::Mat testImage, core::AppConfig config)
    : m_template(std::move(templateImage)), m_test(std::move(testImage)), m_config(std::move(config)) {
}

TunerSettings Analyser::initialSettings() const {
	TunerSettings settings{};
	settings.stepPx          = m_config.sampling.stepPx;
	settings.useAxesFallback = m_config.registration.useAxesFallback;
	settings.useEccFallback  = m_config.registration.useEccFallback;
	return settings;
}

cv::Mat Analyser::analyse(const TunerSettings& settings) const {
	if (m_template.empty() || m_test.empty()) {
		return buildInfoTile("Input Error", "Could not load template or test image.");
	}

	try {
		auto config                         = m_config;
		config.sampling.stepPx              = settings.stepPx;
		config.registration.useAxesFallback = settings.useAxesFallback;
		config.registration.useEccFallback  = settings.useEccFallback;
		config.validate();
		return run(settings.step, config);
	} catch (const std::exception& e) {
		return buildInfoTile("Analysis Error", e.what());
	}
}

cv::Mat Analyser::run(const PipelineStep step, const core::AppConfig& config) const {
	core::DebugVisualizer debugger;

	switch (step) {
	case PipelineStep::Extraction:
		core::extractIdealContour(m_template, config.extraction, &debugger);
		core::extractRealContour(m_test, config.extraction, &debugger);
		break;

	case PipelineStep::Registration: {
		const auto ideal = core::extractIdealContour(m_template, config.extraction);
		const auto real  = core::extractRealContour(m_test, config.extraction);
		if (!ideal.success || !real.success) {
			return buildInfoTile("Registration", "Contour extraction failed for these images.");
		}

		const auto idealPoints = core::resampleClosedContour(ideal.contour, config.sampling);
		const auto candidates  = core::estimateRegistrationCandidates(m_template, m_test, config.registration, &debugger);
		addCandidateOverlays(debugger, m_template, core::selectRegistration(candidates, real.contour, idealPoints), idealPoints, real.contour);
		break;
	}

	case PipelineStep::Distance: {
		const auto measurement = core::measureCut(m_template, m_test, config);
		if (measurement.status != core::MeasurementStatus::Ok) {
			return buildInfoTile("Distance", "Contour extraction failed for these images.");
		}

		debugger.beginStage("Distances");
		debugger.add("Distance Map", measurement.distanceMap);
		debugger.addContours(fmt::format("MAD {:.2f}px  IPN {:.1f}", measurement.statsPx.mad, measurement.ipnPx.ipn), m_template,
		                     {{measurement.idealPoints, cv::Scalar(0, 200, 0)}, {measurement.realPoints, cv::Scalar(0, 0, 220)}});
		debugger.endStage();
		break;
	}

	case PipelineStep::All:
		core::measureCut(m_template, m_test, config, {}, &debugger);
		break;
	}

	const cv::Mat mosaic = debugger.buildMosaic();
	if (mosaic.empty()) {
		return buildInfoTile("No Debug Output", "Selected stage produced no visuals.");
	}
	return mosaic;
}

} // namespace cutprec::precision
