#include "precision/pipeline/pipeline.hpp"

#include "precision/core/measurement.hpp"
#include "precision/pipeline/artifacts.hpp"
#include "precision/pipeline/configLoader.hpp"
#include "precision/pipeline/gitInfo.hpp"
#include "precision/pipeline/report.hpp"
#include "precision/pipeline/runLog.hpp"

#include <stdexcept>

namespace cutprec::precision::pipeline {

namespace {

static bool labeledModeRequested(const TauAutoOptions& o) {
	return !o.goodReports.empty() || !o.badReports.empty();
}

static tau::TargetTauRequest targetRequest(const TauAutoOptions& o) {
	tau::TargetTauRequest request{};
	request.reportPatterns = o.reports;
	request.targetIpn      = o.targetIpn;
	request.preferPx       = o.preferPx;
	request.statistic      = tau::parseTauStatistic(o.statistic);
	request.tauMin         = o.tauMin;
	request.tauMax         = o.tauMax;
	return request;
}

static tau::LabeledTauRequest labeledRequest(const TauAutoOptions& o) {
	tau::LabeledTauRequest request{};
	request.goodReportPatterns = o.goodReports;
	request.badReportPatterns  = o.badReports;
	request.acceptIpn          = o.acceptIpn;
	request.preferPx           = o.preferPx;
	request.tauMin             = o.tauMin;
	request.tauMax             = o.tauMax;
	request.curveMaxPoints     = o.curveMaxPoints;
	request.policy             = o.policy;
	if (o.objective) {
		request.overrides.objective = tau::parseTauObjective(*o.objective);
	}
	request.overrides.maxMeanIpnBad = o.maxMeanIpnBad;
	request.overrides.minMeanIpnGap = o.minMeanIpnGap;
	request.overrides.minTpr        = o.minTpr;
	request.overrides.minTnr        = o.minTnr;
	request.curveCsv                = o.curveCsv;
	request.curvePng                = o.curvePng;
	return request;
}

//! Apply the automatic tau modes to the configuration. Returns the context stored in the report.
static TauCalibrationContext applyTauAuto(const TauAutoOptions& o, core::AppConfig& config, TauCalibrationContext context, RunLog& log,
                                          const core::StageReporter& reporter) {
	const bool labeled = labeledModeRequested(o);

	if (!o.reports.empty() && labeled) {
		throw std::invalid_argument("Use either --tau-auto-reports OR (--tau-auto-good-reports with --tau-auto-bad-reports)");
	}

	if (!o.reports.empty()) {
		core::ScopedStage stage(reporter, "tau.auto_reports");
		if (o.curveCsv || o.curvePng) {
			throw std::invalid_argument("--tau-auto-curve-csv/--tau-auto-curve-png are only valid with labeled auto mode");
		}
		auto calibration  = tau::calibrateTargetTauFromPatterns(targetRequest(o));
		config.metrics.tau = calibration.result.tau;
		return TauCalibrationContext::fromAutoReports(std::move(calibration));
	}

	if (labeled) {
		core::ScopedStage stage(reporter, "tau.auto_labeled_reports");
		if (o.goodReports.empty() || o.badReports.empty()) {
			throw std::invalid_argument("Both --tau-auto-good-reports and --tau-auto-bad-reports are required together");
		}
		auto calibration = tau::calibrateLabeledTauFromPatterns(labeledRequest(o));
		if (calibration.curveCsv) {
			log.artifactWritten("tau.auto_labeled_reports", "tau_curve_csv", *calibration.curveCsv);
		}
		if (calibration.curvePng) {
			log.artifactWritten("tau.auto_labeled_reports", "tau_curve_png", *calibration.curvePng);
		}
		config.metrics.tau = calibration.result.tau;
		return TauCalibrationContext::fromAutoLabeledReports(std::move(calibration));
	}

	if (o.curveCsv || o.curvePng) {
		throw std::invalid_argument("--tau-auto-curve-csv/--tau-auto-curve-png are only valid with labeled auto mode");
	}
	return context;
}

static void writeArtifacts(const std::filesystem::path& outDir, const cv::Mat& templateImage, const core::Measurement& m, RunLog& log) {
	const auto written = [&log](const char* artifact, const std::filesystem::path& path) { log.artifactWritten("artifacts.write", artifact, path); };

	writeOverlay(outDir / "overlay.png", templateImage, m.idealPoints, m.realPoints);
	written("overlay_png", outDir / "overlay.png");

	writeErrorMap(outDir / "error_map.png", templateImage, m.realPoints, m.distancesPx);
	written("error_map_png", outDir / "error_map.png");

	writeErrorHistogram(outDir / "error_hist.png", m.distancesPx);
	written("error_hist_png", outDir / "error_hist.png");

	writeDistancesCsv(outDir / "distances.csv", m.realPoints, m.distancesPx, m.calibration.mmPerPx);
	written("distances_csv", outDir / "distances.csv");
}

} // namespace

PipelineResult runPipeline(const PipelineOptions& options) {
	RunLog log(options.outDir, buildRunId(), options.debug);
	const core::StageReporter reporter = log.stageReporter();
	log.event(spdlog::level::info, "pipeline_started", {{"event", "pipeline.start"}, {"stage", "pipeline"}, {"status", "started"}});

	core::AppConfig config = loadAppConfig(options.configPath);
	log.event(spdlog::level::info, "config_loaded", {{"event", "config.loaded"}, {"stage", "config"}, {"status", "ok"}});

	TauCalibrationContext tauContext = TauCalibrationContext::fixed();
	if (options.stepPx) {
		config.sampling.stepPx = *options.stepPx;
	}
	if (options.numPoints) {
		config.sampling.numPoints = *options.numPoints;
	}
	if (options.tau) {
		config.metrics.tau = *options.tau;
		tauContext.source  = "cli_tau";
	}

	tauContext = applyTauAuto(options.tauAuto, config, std::move(tauContext), log, reporter);

	if (options.manualMmPerPx) {
		config.calibration.manualMmPerPx = *options.manualMmPerPx;
	}
	if (options.noKdValidate) {
		config.distance.validateWithKdTree = false;
	}
	config.validate();

	cv::Mat templateImage;
	cv::Mat testImage;
	{
		core::ScopedStage stage(reporter, "image.load");
		templateImage = readBgrImage(options.templatePath);
		testImage     = readBgrImage(options.testPath);
	}

	const core::Measurement m = core::measureCut(templateImage, testImage, config, reporter);
	const ReportInputs inputs{options.templatePath, options.testPath};
	const auto reportPath = options.outDir / "report.json";

	if (options.debug) {
		if (!m.real.cleanedMask.empty()) {
			writeImage(options.outDir / "real_mask.png", m.real.cleanedMask);
			log.artifactWritten("extract.real", "real_mask_png", options.outDir / "real_mask.png", spdlog::level::debug);
		}
		if (!m.ideal.cleanedMask.empty()) {
			writeImage(options.outDir / "ideal_mask.png", m.ideal.cleanedMask);
			log.artifactWritten("extract.ideal", "ideal_mask_png", options.outDir / "ideal_mask.png", spdlog::level::debug);
		}
	}

	if (m.status == core::MeasurementStatus::ExtractionFailed) {
		PipelineResult result{EXIT_EXTRACTION_FAILURE, buildFailureReport(inputs, config, m, log.runId()), reportPath};
		writeJson(reportPath, result.report);
		log.artifactWritten("report.write", "report_json", reportPath);
		log.event(spdlog::level::warn, "pipeline_finished_with_failure",
		          {{"event", "pipeline.end"}, {"stage", "pipeline"}, {"status", "failed"}, {"reason", "contour_extraction_failed"}});
		return result;
	}

	log.event(m.registration.selected.success ? spdlog::level::info : spdlog::level::warn, "registration_selected",
	          {{"event", "register.selected"},
	           {"stage", "register"},
	           {"status", m.registration.selected.success ? "ok" : "warning"},
	           {"method", std::string(core::toString(m.registration.selected.method))},
	           {"selection_mad_px", tau::optionalToJson(m.registration.selectionMadPx)}});

	if (m.validation.status != core::ValidationStatus::Ok && m.validation.status != core::ValidationStatus::Disabled) {
		log.event(spdlog::level::warn, "distance_validation_warning",
		          {{"event", "distance.validation"},
		           {"stage", "distance.compute"},
		           {"status", "warning"},
		           {"validation_status", core::toString(m.validation.status)},
		           {"mean_abs_delta_px", tau::optionalToJson(m.validation.meanAbsDeltaPx)}});
	}

	{
		core::ScopedStage stage(reporter, "artifacts.write");
		writeArtifacts(options.outDir, templateImage, m, log);
	}

	PipelineResult result{EXIT_OK, buildSuccessReport(inputs, config, m, log.runId(), options.outDir, tauContext, gitCommit()), reportPath};
	writeJson(reportPath, result.report);
	log.artifactWritten("report.write", "report_json", reportPath);
	log.event(spdlog::level::info, "pipeline_finished",
	          {{"event", "pipeline.end"}, {"stage", "pipeline"}, {"status", "ok"}, {"ipn_px", m.ipnPx.ipn}, {"ipn_mm", m.ipnMm ? nlohmann::json(m.ipnMm->ipn) : nlohmann::json(nullptr)}});
	return result;
}

} // namespace cutprec::precision::pipeline
