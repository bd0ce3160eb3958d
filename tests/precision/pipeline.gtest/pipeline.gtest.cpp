#include "precision/pipeline/pipeline.hpp"

#include "tempDirectory.hpp"

#include <gtest/gtest.h>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <stdexcept>

namespace cutprec::precision::pipeline {
namespace gtest {

class Pipeline : public TempDirectory {
protected:
	//! Circle drawing, aligned photo of the cut disc and a configuration that keeps the identity registration.
	PipelineOptions circleRun() const {
		cv::Mat drawing(400, 400, CV_8UC3, cv::Scalar(255, 255, 255));
		cv::circle(drawing, {200, 200}, 100, cv::Scalar(0, 0, 0), 2, cv::LINE_AA);
		cv::Mat photo(400, 400, CV_8UC3, cv::Scalar(235, 235, 235));
		cv::circle(photo, {200, 200}, 100, cv::Scalar(30, 30, 30), cv::FILLED, cv::LINE_AA);
		cv::imwrite((dir() / "template.png").string(), drawing);
		cv::imwrite((dir() / "test.png").string(), photo);

		PipelineOptions options{};
		options.templatePath = dir() / "template.png";
		options.testPath     = dir() / "test.png";
		options.outDir       = dir() / "out";
		options.configPath   = writeText("config.json", R"({
			"registration": {"min_matches": 100000, "use_axes_fallback": false, "use_ecc_fallback": false}
		})");
		options.manualMmPerPx = 0.1;
		return options;
	}

	PipelineOptions blankRun() const {
		const cv::Mat blank(120, 120, CV_8UC3, cv::Scalar(255, 255, 255));
		cv::imwrite((dir() / "blank.png").string(), blank);

		PipelineOptions options{};
		options.templatePath = dir() / "blank.png";
		options.testPath     = dir() / "blank.png";
		options.outDir       = dir() / "out";
		return options;
	}

	void writeTauReport(const std::string& name, double madPx, double scalePx) const {
		writeText(name, nlohmann::json{{"metrics", {{"mad_px", madPx}, {"scale_px", scalePx}}}}.dump());
	}
};

TEST_F(Pipeline, Circle_WritesReportAndArtifacts) {
	PipelineOptions options = circleRun();
	options.tau = 0.05;

	const PipelineResult result = runPipeline(options);
	ASSERT_EQ(result.exitCode, EXIT_OK);
	EXPECT_EQ(result.reportPath, options.outDir / "report.json");

	const nlohmann::json& report = result.report;
	EXPECT_EQ(report["status"], "ok");
	EXPECT_EQ(report["run_id"].get<std::string>().size(), 12u);
	EXPECT_EQ(report["calibration"]["method"], "manual");
	EXPECT_EQ(report["metrics"]["tau"], 0.05);
	EXPECT_LT(report["metrics"]["mad_px"].get<double>(), 5.0);
	EXPECT_GE(report["metrics"]["ipn_px"].get<double>(), 0.0);
	EXPECT_LE(report["metrics"]["ipn_px"].get<double>(), 100.0);
	EXPECT_FALSE(report["metrics"]["mad_mm"].is_null());
	EXPECT_EQ(report["tau_calibration"]["mode"], "fixed");
	EXPECT_EQ(report["tau_calibration"]["source"], "cli_tau");
	EXPECT_EQ(report["config"]["registration"]["min_matches"], 100000);

	for (const char* name: {"report.json", "overlay.png", "error_map.png", "error_hist.png", "distances.csv", "run.log", "run.jsonl"}) {
		EXPECT_TRUE(std::filesystem::exists(options.outDir / name)) << name;
	}
	EXPECT_FALSE(std::filesystem::exists(options.outDir / "real_mask.png"));
	EXPECT_EQ(nlohmann::json::parse(readText(result.reportPath)), report);
}

TEST_F(Pipeline, Circle_DebugWritesMasks) {
	PipelineOptions options = circleRun();
	options.debug        = true;
	options.noKdValidate = true;

	const PipelineResult result = runPipeline(options);
	ASSERT_EQ(result.exitCode, EXIT_OK);
	EXPECT_TRUE(std::filesystem::exists(options.outDir / "real_mask.png"));
	EXPECT_TRUE(std::filesystem::exists(options.outDir / "ideal_mask.png"));
	EXPECT_EQ(result.report["distance_method"]["validation"], "disabled");
	EXPECT_EQ(result.report["tau_calibration"]["source"], "config_or_cli");
}

TEST_F(Pipeline, Circle_LabeledTauAuto) {
	writeTauReport("good1.json", 8.0, 100.0);
	writeTauReport("good2.json", 10.0, 100.0);
	writeTauReport("bad1.json", 35.0, 100.0);
	writeTauReport("bad2.json", 40.0, 100.0);

	PipelineOptions options         = circleRun();
	options.noKdValidate            = true;
	options.tauAuto.goodReports     = {(dir() / "good*.json").string()};
	options.tauAuto.badReports      = {(dir() / "bad*.json").string()};
	options.tauAuto.policy          = "balanced";
	options.tauAuto.preferPx        = true;

	const PipelineResult result = runPipeline(options);
	ASSERT_EQ(result.exitCode, EXIT_OK);

	const nlohmann::json& section = result.report["tau_calibration"];
	EXPECT_EQ(section["mode"], "auto_from_labeled_reports");
	EXPECT_EQ(section["policy"], "balanced");
	EXPECT_EQ(section["objective"], "balanced_accuracy_then_gap");
	EXPECT_EQ(section["constraints_satisfied"], true);
	EXPECT_GE(section["feasible_points"].get<int>(), 1);
	const double tau = result.report["metrics"]["tau"].get<double>();
	EXPECT_GE(tau, tau::DEFAULT_TAU_MIN);
	EXPECT_LE(tau, tau::DEFAULT_TAU_MAX);
}

TEST_F(Pipeline, BlankImages_FailureReport) {
	const PipelineOptions options = blankRun();

	const PipelineResult result = runPipeline(options);
	EXPECT_EQ(result.exitCode, EXIT_EXTRACTION_FAILURE);
	EXPECT_EQ(result.report["status"], "failed");
	EXPECT_FALSE(result.report["stages"]["ideal_extraction"]["success"].get<bool>());
	EXPECT_TRUE(std::filesystem::exists(options.outDir / "report.json"));
	EXPECT_FALSE(std::filesystem::exists(options.outDir / "overlay.png"));
}

TEST_F(Pipeline, TauAuto_ConflictingModes) {
	PipelineOptions options        = blankRun();
	options.tauAuto.reports        = {(dir() / "r*.json").string()};
	options.tauAuto.goodReports    = {(dir() / "good*.json").string()};
	options.tauAuto.badReports     = {(dir() / "bad*.json").string()};
	EXPECT_THROW(runPipeline(options), std::invalid_argument);
}

TEST_F(Pipeline, TauAuto_CurveNeedsLabeledMode) {
	PipelineOptions options   = blankRun();
	options.tauAuto.curveCsv  = dir() / "curve.csv";
	EXPECT_THROW(runPipeline(options), std::invalid_argument);
}

TEST_F(Pipeline, TauAuto_LabeledNeedsBothSets) {
	PipelineOptions options     = blankRun();
	options.tauAuto.goodReports = {(dir() / "good*.json").string()};
	EXPECT_THROW(runPipeline(options), std::invalid_argument);
}

TEST_F(Pipeline, InvalidOverride) {
	PipelineOptions options = blankRun();
	options.tau             = -1.0;
	EXPECT_THROW(runPipeline(options), core::ConfigError);
}

TEST_F(Pipeline, MissingImage) {
	PipelineOptions options = blankRun();
	options.testPath        = dir() / "missing.png";
	EXPECT_THROW(runPipeline(options), std::runtime_error);
}

} // namespace gtest
} // namespace cutprec::precision::pipeline
