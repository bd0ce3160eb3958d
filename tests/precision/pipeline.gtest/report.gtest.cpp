#include "precision/pipeline/report.hpp"

#include <gtest/gtest.h>

#include <regex>

namespace cutprec::precision::pipeline {
namespace gtest {

TEST(Report, TauContext_Fixed) {
	const nlohmann::json section = TauCalibrationContext::fixed().toJson();
	EXPECT_EQ(section["mode"], "fixed");
	EXPECT_EQ(section["source"], "config_or_cli");
	EXPECT_EQ(section["policy"], "custom");
	EXPECT_EQ(section["reports_used"], 0);
	EXPECT_TRUE(section["units"].is_null());
	EXPECT_TRUE(section["target_ipn"].is_null());
	EXPECT_TRUE(section["constraints_satisfied"].is_null());
	EXPECT_TRUE(section["report_paths"].empty());
}

TEST(Report, TauContext_TargetReports) {
	tau::TargetTauOutput output{};
	output.result.tau         = 0.04;
	output.result.units       = tau::TauUnits::Px;
	output.result.reportsUsed = 1;
	output.result.targetIpn   = 80.0;
	output.result.candidates  = {{"/reports/a.json", 0.04, tau::TauUnits::Px}};
	output.reportPatterns     = {"/reports/*.json"};

	const nlohmann::json section = TauCalibrationContext::fromAutoReports(output).toJson();
	EXPECT_EQ(section["mode"], "auto_from_reports");
	EXPECT_EQ(section["source"], "reports");
	EXPECT_EQ(section["target_ipn"], 80.0);
	EXPECT_EQ(section["units"], "px");
	EXPECT_EQ(section["statistic"], "median");
	EXPECT_EQ(section["report_patterns"], nlohmann::json::array({"/reports/*.json"}));
	EXPECT_EQ(section["report_paths"], nlohmann::json::array({"/reports/a.json"}));
	EXPECT_TRUE(section["accept_ipn"].is_null());
}

TEST(Report, TauContext_LabeledReports) {
	tau::LabeledTauOutput output{};
	output.policy                       = tau::tauPolicyPreset("balanced");
	output.result.units                 = tau::TauUnits::Px;
	output.result.acceptIpn             = 70.0;
	output.result.goodReportsUsed       = 2;
	output.result.badReportsUsed        = 3;
	output.result.constraints           = output.policy.constraints;
	output.result.constraintsSatisfied  = true;
	output.result.feasiblePoints        = 4;
	output.result.selected.tp           = 2;
	output.curvePoints                  = 9;

	const nlohmann::json section = TauCalibrationContext::fromAutoLabeledReports(output).toJson();
	EXPECT_EQ(section["mode"], "auto_from_labeled_reports");
	EXPECT_EQ(section["source"], "reports_labeled");
	EXPECT_EQ(section["policy"], "balanced");
	EXPECT_EQ(section["reports_used"], 5);
	EXPECT_EQ(section["max_mean_ipn_bad"], 25.0);
	EXPECT_TRUE(section["min_tpr"].is_null());
	EXPECT_EQ(section["constraints_satisfied"], true);
	EXPECT_EQ(section["feasible_points"], 4);
	EXPECT_EQ(section["tp"], 2);
	EXPECT_TRUE(section["curve_csv"].is_null());
	EXPECT_EQ(section["curve_points"], 9);
	EXPECT_TRUE(section["target_ipn"].is_null());
}

TEST(Report, UtcTimestamp_Format) {
	const std::regex iso(R"(\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}\.\d{6}\+00:00)");
	EXPECT_TRUE(std::regex_match(utcTimestamp(), iso)) << utcTimestamp();
}

TEST(Report, Failure_ListsExtractionStages) {
	core::Measurement m{};
	m.ideal.success = true;
	m.real.success  = false;
	m.real.reason   = "no_real_contour_found";

	const nlohmann::json report = buildFailureReport({"template.png", "test.png"}, core::AppConfig{}, m, "0123456789ab");
	EXPECT_EQ(report["status"], "failed");
	EXPECT_EQ(report["run_id"], "0123456789ab");
	EXPECT_TRUE(report["stages"]["ideal_extraction"]["success"].get<bool>());
	EXPECT_TRUE(report["stages"]["ideal_extraction"]["reason"].is_null());
	EXPECT_FALSE(report["stages"]["real_extraction"]["success"].get<bool>());
	EXPECT_EQ(report["stages"]["real_extraction"]["reason"], "no_real_contour_found");
	EXPECT_TRUE(std::filesystem::path(report["inputs"]["template"].get<std::string>()).is_absolute());
	EXPECT_TRUE(report["config"].contains("metrics"));
	EXPECT_FALSE(report.contains("metrics"));
}

TEST(Report, Success_Layout) {
	core::Measurement m{};
	m.status                = core::MeasurementStatus::Ok;
	m.statsPx               = {1.0, 0.5, 2.0, 3.0};
	m.scalePx               = 100.0;
	m.ipnPx                 = {50.0, 2.0};
	m.registration.selected = core::RegistrationResult{};
	m.registration.candidates.push_back({m.registration.selected, std::nullopt});
	m.validation            = {core::ValidationStatus::Ok, 0.1};

	core::AppConfig config{};
	const nlohmann::json report = buildSuccessReport({"template.png", "test.png"}, config, m, "0123456789ab", "/tmp/run", TauCalibrationContext::fixed(),
	                                                 std::string("abc123"));

	EXPECT_EQ(report["status"], "ok");
	EXPECT_EQ(report["registration"]["selection_strategy"], "min_contour_mad_kdtree");
	EXPECT_EQ(report["registration"]["status"], "warning");
	EXPECT_EQ(report["registration"]["candidates"].size(), 1u);
	EXPECT_TRUE(report["registration"]["candidates"][0]["selection_mad_px"].is_null());
	EXPECT_EQ(report["distance_method"]["primary"], "distance_transform");
	EXPECT_EQ(report["distance_method"]["validation"], "kdtree");
	EXPECT_EQ(report["distance_method"]["validation_status"], "ok");
	EXPECT_EQ(report["metrics"]["mad_px"], 1.0);
	EXPECT_EQ(report["metrics"]["ipn_px"], 50.0);
	EXPECT_EQ(report["metrics"]["tau"], config.metrics.tau);
	EXPECT_TRUE(report["metrics"]["mad_mm"].is_null());
	EXPECT_TRUE(report["metrics"]["ipn_mm"].is_null());
	EXPECT_EQ(report["calibration"]["status"], "missing");
	EXPECT_EQ(report["tau_calibration"]["mode"], "fixed");
	EXPECT_EQ(report["artifacts"]["overlay_png"], "/tmp/run/overlay.png");
	EXPECT_EQ(report["git"]["commit"], "abc123");
}

} // namespace gtest
} // namespace cutprec::precision::pipeline
